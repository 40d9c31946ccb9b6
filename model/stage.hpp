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

/// \file model/stage.hpp
/// Definition of the stages a run goes through.
///
/// A run progresses linearly through the preparation, building, testing and
/// completed stages.  The canceled outcome can be reached at any point and is
/// not part of the sequence: it has no position in the ordered list of stages.

#if !defined(MODEL_STAGE_HPP)
#define MODEL_STAGE_HPP

#include <ostream>
#include <string>
#include <vector>

namespace model {


/// Stage or terminal outcome of a run.
enum stage {
    stage_preparation,
    stage_building,
    stage_testing,
    stage_completed,
    stage_canceled
};


/// Collection of stages.
typedef std::vector< stage > stages_vector;


const stages_vector& ordered_stages(void);
int stage_index(const stage);
bool is_terminal(const stage);

const char* stage_name(const stage);
const char* stage_description(const stage);
stage parse_stage(const std::string&);

std::ostream& operator<<(std::ostream&, const stage);


}  // namespace model


#endif  // !defined(MODEL_STAGE_HPP)
