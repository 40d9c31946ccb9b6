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

#include "cli/cmd_record_result.hpp"

#include <cstdlib>

#include <atf-c++.hpp>

#include "engine/config.hpp"
#include "model/case_result.hpp"
#include "model/run.hpp"
#include "store/backend.hpp"
#include "store/exceptions.hpp"
#include "store/read_transaction.hpp"
#include "store/write_transaction.hpp"
#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/exceptions.hpp"
#include "utils/cmdline/ui_mock.hpp"
#include "utils/config/tree.ipp"
#include "utils/fs/path.hpp"

namespace cmdline = utils::cmdline;
namespace config = utils::config;
namespace fs = utils::fs;

using cli::cmd_record_result;


namespace {


/// Creates a store in the work directory with a single run.
///
/// \return A configuration tree pointing to the new store.
static config::tree
setup_store(void)
{
    store::backend backend = store::backend::open_rw(fs::path("store.db"));
    store::write_transaction tx = backend.start_write();
    tx.put_run(model::run(model::platform_windows, model::run_type_commit,
                          "token", "https://github.com/owner/project",
                          "master", "abc", 0));
    tx.commit();

    config::tree user_config = engine::default_config();
    user_config.set_string("store_file", "store.db");
    return user_config;
}


/// Builds the arguments to the record-result command.
///
/// \param case_id The identifier of the test case.
/// \param exit_code The exit code of the test case.
///
/// \return The arguments, for run 1 with a runtime of 150ms and an expected
/// exit code of 0.
static cmdline::args_vector
make_args(const char* case_id, const char* exit_code)
{
    cmdline::args_vector args;
    args.push_back("record-result");
    args.push_back("1");
    args.push_back(case_id);
    args.push_back("150");
    args.push_back(exit_code);
    args.push_back("0");
    return args;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(matched_and_mismatched);
ATF_TEST_CASE_BODY(matched_and_mismatched)
{
    const config::tree user_config = setup_store();

    cmd_record_result cmd;
    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, cmd.main(&ui, make_args("4", "0"),
                                          user_config));
    ATF_REQUIRE_EQ(EXIT_SUCCESS, cmd.main(&ui, make_args("3", "-11"),
                                          user_config));
    ATF_REQUIRE_EQ(2, ui.out_log().size());
    ATF_REQUIRE_EQ("Case 4 of run 1: exit code matched", ui.out_log()[0]);
    ATF_REQUIRE_EQ("Case 3 of run 1: exit code mismatch", ui.out_log()[1]);

    store::backend backend = store::backend::open_ro(fs::path("store.db"));
    store::read_transaction tx = backend.start_read();
    const model::case_results_vector results = tx.get_case_results(1);
    tx.finish();
    ATF_REQUIRE_EQ(2, results.size());
    ATF_REQUIRE_EQ(model::case_result(1, 3, 150, -11, 0), results[0]);
    ATF_REQUIRE_EQ(model::case_result(1, 4, 150, 0, 0), results[1]);
}


ATF_TEST_CASE_WITHOUT_HEAD(duplicate_case);
ATF_TEST_CASE_BODY(duplicate_case)
{
    const config::tree user_config = setup_store();

    cmd_record_result cmd;
    cmdline::ui_mock ui;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, cmd.main(&ui, make_args("4", "0"),
                                          user_config));
    ATF_REQUIRE_THROW_RE(store::error, "Cannot store result of case 4 in run 1",
                         cmd.main(&ui, make_args("4", "1"), user_config));
}


ATF_TEST_CASE_WITHOUT_HEAD(invalid_arguments);
ATF_TEST_CASE_BODY(invalid_arguments)
{
    const config::tree user_config = setup_store();

    cmd_record_result cmd;
    cmdline::ui_mock ui;
    ATF_REQUIRE_THROW_RE(cmdline::usage_error, "Invalid case-id 'x'",
                         cmd.main(&ui, make_args("x", "0"), user_config));
    ATF_REQUIRE_THROW_RE(cmdline::usage_error, "Invalid exit-code '1.5'",
                         cmd.main(&ui, make_args("1", "1.5"), user_config));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, matched_and_mismatched);
    ATF_ADD_TEST_CASE(tcs, duplicate_case);
    ATF_ADD_TEST_CASE(tcs, invalid_arguments);
}
