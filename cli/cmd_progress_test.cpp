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

#include "cli/cmd_progress.hpp"

#include <cstdlib>

#include <atf-c++.hpp>

#include "engine/config.hpp"
#include "model/run.hpp"
#include "model/run_event.hpp"
#include "model/stage.hpp"
#include "store/backend.hpp"
#include "store/exceptions.hpp"
#include "store/write_transaction.hpp"
#include "utils/cmdline/base_command.ipp"
#include "utils/cmdline/ui_mock.hpp"
#include "utils/config/tree.ipp"
#include "utils/datetime.hpp"
#include "utils/fs/path.hpp"

namespace cmdline = utils::cmdline;
namespace config = utils::config;
namespace datetime = utils::datetime;
namespace fs = utils::fs;

using cli::cmd_progress;


namespace {


/// Creates a store in the work directory with a single run.
///
/// \return A configuration tree pointing to the new store.
static config::tree
setup_store(void)
{
    store::backend backend = store::backend::open_rw(fs::path("store.db"));
    store::write_transaction tx = backend.start_write();
    tx.put_run(model::run(model::platform_linux, model::run_type_commit,
                          "token", "https://github.com/owner/project.git",
                          "master", "abc", 0));
    tx.commit();

    config::tree user_config = engine::default_config();
    user_config.set_string("store_file", "store.db");
    user_config.set_string("artifacts_dir", "results");
    return user_config;
}


/// Records an event for run 1.
///
/// \param stage The stage entered by the run.
/// \param iso_timestamp The time of the event, in ISO 8601 format.
static void
put_event(const model::stage stage, const char* iso_timestamp)
{
    store::backend backend = store::backend::open_rw(fs::path("store.db"));
    store::write_transaction tx = backend.start_write();
    tx.put_run_event(model::run_event(
        1, stage, datetime::timestamp::from_iso8601(iso_timestamp), ""));
    tx.commit();
}


/// Runs the progress command for run 1.
///
/// \param user_config The configuration to pass to the command.
/// \param [out] ui The mock user interface to collect the output.
static void
run_progress(const config::tree& user_config, cmdline::ui_mock& ui)
{
    cmdline::args_vector args;
    args.push_back("progress");
    args.push_back("1");

    cmd_progress cmd;
    ATF_REQUIRE_EQ(EXIT_SUCCESS, cmd.main(&ui, args, user_config));
    ATF_REQUIRE_EQ(7, ui.out_log().size());
    ATF_REQUIRE_EQ("stages: preparation,building,testing,completed",
                   ui.out_log()[2]);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(no_events);
ATF_TEST_CASE_BODY(no_events)
{
    const config::tree user_config = setup_store();

    cmdline::ui_mock ui;
    run_progress(user_config, ui);
    ATF_REQUIRE_EQ("state: error", ui.out_log()[0]);
    ATF_REQUIRE_EQ("step: -1", ui.out_log()[1]);
    ATF_REQUIRE_EQ("start: -", ui.out_log()[3]);
    ATF_REQUIRE_EQ("end: -", ui.out_log()[4]);
    ATF_REQUIRE_EQ("finished: false", ui.out_log()[5]);
    ATF_REQUIRE_EQ("failed: false", ui.out_log()[6]);
}


ATF_TEST_CASE_WITHOUT_HEAD(in_progress);
ATF_TEST_CASE_BODY(in_progress)
{
    const config::tree user_config = setup_store();
    put_event(model::stage_preparation, "2020-05-01T10:00:00Z");
    put_event(model::stage_building, "2020-05-01T10:01:00Z");

    cmdline::ui_mock ui;
    run_progress(user_config, ui);
    ATF_REQUIRE_EQ("state: ok", ui.out_log()[0]);
    ATF_REQUIRE_EQ("step: 1", ui.out_log()[1]);
    ATF_REQUIRE_EQ("start: 2020-05-01T10:00:00.000000Z", ui.out_log()[3]);
    ATF_REQUIRE_EQ("end: -", ui.out_log()[4]);
    ATF_REQUIRE_EQ("finished: false", ui.out_log()[5]);
    ATF_REQUIRE_EQ("failed: false", ui.out_log()[6]);
}


ATF_TEST_CASE_WITHOUT_HEAD(completed);
ATF_TEST_CASE_BODY(completed)
{
    const config::tree user_config = setup_store();
    put_event(model::stage_preparation, "2020-05-01T10:00:00Z");
    put_event(model::stage_building, "2020-05-01T10:01:00Z");
    put_event(model::stage_testing, "2020-05-01T10:05:00Z");
    put_event(model::stage_completed, "2020-05-01T10:30:00Z");

    cmdline::ui_mock ui;
    run_progress(user_config, ui);
    ATF_REQUIRE_EQ("state: ok", ui.out_log()[0]);
    ATF_REQUIRE_EQ("step: 3", ui.out_log()[1]);
    ATF_REQUIRE_EQ("end: 2020-05-01T10:30:00.000000Z", ui.out_log()[4]);
    ATF_REQUIRE_EQ("finished: true", ui.out_log()[5]);
    ATF_REQUIRE_EQ("failed: false", ui.out_log()[6]);
}


ATF_TEST_CASE_WITHOUT_HEAD(canceled);
ATF_TEST_CASE_BODY(canceled)
{
    const config::tree user_config = setup_store();
    put_event(model::stage_preparation, "2020-05-01T10:00:00Z");
    put_event(model::stage_building, "2020-05-01T10:01:00Z");
    put_event(model::stage_canceled, "2020-05-01T10:02:00Z");

    cmdline::ui_mock ui;
    run_progress(user_config, ui);
    ATF_REQUIRE_EQ("state: error", ui.out_log()[0]);
    ATF_REQUIRE_EQ("step: 1", ui.out_log()[1]);
    ATF_REQUIRE_EQ("end: 2020-05-01T10:02:00.000000Z", ui.out_log()[4]);
    ATF_REQUIRE_EQ("finished: true", ui.out_log()[5]);
    ATF_REQUIRE_EQ("failed: true", ui.out_log()[6]);
}


ATF_TEST_CASE_WITHOUT_HEAD(unknown_run);
ATF_TEST_CASE_BODY(unknown_run)
{
    const config::tree user_config = setup_store();

    cmdline::args_vector args;
    args.push_back("progress");
    args.push_back("5");

    cmd_progress cmd;
    cmdline::ui_mock ui;
    ATF_REQUIRE_THROW_RE(store::error, "Run 5 does not exist",
                         cmd.main(&ui, args, user_config));
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, no_events);
    ATF_ADD_TEST_CASE(tcs, in_progress);
    ATF_ADD_TEST_CASE(tcs, completed);
    ATF_ADD_TEST_CASE(tcs, canceled);
    ATF_ADD_TEST_CASE(tcs, unknown_run);
}
