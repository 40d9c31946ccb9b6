// Copyright 2014 Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
// * Redistributions of source code must retain the above copyright
//   notice, this list of conditions and the following disclaimer.
// * Redistributions in binary form must reproduce the above copyright
//   notice, this list of conditions and the following disclaimer in the
//   documentation and/or other materials provided with the distribution.
// * Neither the name of Google Inc. nor the names of its contributors
//   may be used to endorse or promote products derived from this software
//   without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/// \file store/read_transaction.hpp
/// Implementation of read-only transactions on the backend.

#if !defined(STORE_READ_TRANSACTION_HPP)
#define STORE_READ_TRANSACTION_HPP

extern "C" {
#include <stdint.h>
}

#include <memory>

#include "model/case_result.hpp"
#include "model/output_comparison.hpp"
#include "model/run_event_fwd.hpp"
#include "model/run_fwd.hpp"

namespace store {


class backend;


/// Read-only transaction on a database store.
///
/// All the queries of a transaction see a consistent snapshot of the
/// database.  The transaction is released when finish() is called or when the
/// object goes out of scope.
class read_transaction {
    struct impl;

    /// Pointer to the shared internal implementation.
    std::shared_ptr< impl > _pimpl;

    friend class backend;
    explicit read_transaction(backend&);

public:
    ~read_transaction(void);

    void finish(void);

    model::run get_run(const int64_t);
    model::run_events_vector get_run_events(const int64_t);
    model::case_results_vector get_case_results(const int64_t);
    model::output_comparisons_vector get_case_outputs(const int64_t,
                                                      const int64_t);
    model::output_comparisons_vector get_run_outputs(const int64_t);
    model::output_comparison get_output(const int64_t, const int64_t,
                                        const int64_t);
};


}  // namespace store

#endif  // !defined(STORE_READ_TRANSACTION_HPP)
