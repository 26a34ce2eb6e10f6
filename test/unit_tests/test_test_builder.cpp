/*
 * Copyright (c) 2025 Robert Bosch GmbH and its subsidiaries
 *
 * This file is part of spin_testgen.
 *
 * spin_testgen is free software: you can redistribute it and/or modify it under the terms of
 * the GNU General Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * spin_testgen is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY;
 * without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 * See the GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along with spin_testgen.
 * If not, see <https://www.gnu.org/licenses/>.
 */

#include <cstdlib>
#include <filesystem>
#include <sstream>

#include "builder/command_line.hpp"
#include "builder/test_builder.hpp"
#include "exceptions/spin_testgen_exceptions.hpp"
#include "manifest/manifest.hpp"
#include "settings/user_settings.hpp"
#include "utils/storm_utilities.hpp"

#include "fake_process_runner.hpp"

#include <gtest/gtest.h>

using spin_testgen::settings::UserSettings;
using spin_testgen::settings::Verb;

class TestBuilderTest : public ::testing::Test {
  protected:
    void SetUp() override {
        _work_folder = std::filesystem::absolute(testFolderName());
        std::filesystem::remove_all(_work_folder);
        _settings.working_folder = _work_folder / "models";
        _settings.checker_command = FAKE_CHECKER;
        _settings.generator_command = FAKE_GENERATOR;
        _settings.target_root = _work_folder / "rtems";
        _settings.simulator_folder = _work_folder / "rsb";
        _settings.simulator_command = "sparc-rtems6-sis -nouartrx";
        _settings.manifest_path = _settings.target_root / "spec" / "model-0.yml";
        _settings.test_code_folder = _settings.target_root / "testsuites" / "validation";
        _settings.test_executable = "build/ts-model-0.exe";
        _settings.baseline_source = "testsuites/validation/ts-model-0.c";
        for (const auto& folder : {_settings.working_folder, _settings.test_code_folder, _settings.manifest_path.parent_path(),
                                   _settings.simulator_folder}) {
            std::filesystem::create_directories(folder);
        }
        touchFile(
            _settings.manifest_path, "source:\n"
                                     "- testsuites/validation/ts-model-0.c\n"
                                     "target: testsuites/validation/ts-model-0.exe\n");
    }

    void TearDown() override {
        std::filesystem::remove_all(_work_folder);
    }

    static UserSettings makeUserSettings(const Verb verb, const std::string& model = "") {
        UserSettings user_settings;
        user_settings.verb = verb;
        user_settings.model = model;
        return user_settings;
    }

    std::vector<std::string> manifestSources() const {
        return spin_testgen::manifest::Manifest::load(_settings.manifest_path).getSources().toSortedVector();
    }

    std::filesystem::path _work_folder;
    spin_testgen::settings::TestBuilderSettings _settings;
};

TEST_F(TestBuilderTest, CompileConfiguresThenBuilds) {
    FakeProcessRunner fake_runner(0U);
    const spin_testgen::builder::TestBuilder test_builder(_settings, fake_runner);
    test_builder.execute(makeUserSettings(Verb::COMPILE));
    const auto& calls = fake_runner.getCalls();
    ASSERT_EQ(calls.size(), 2U);
    EXPECT_EQ(calls.at(0).command, "./waf");
    EXPECT_EQ(calls.at(0).args, std::vector<std::string>{"configure"});
    EXPECT_EQ(calls.at(0).working_folder, _settings.target_root);
    EXPECT_EQ(calls.at(1).command, "./waf");
    EXPECT_TRUE(calls.at(1).args.empty());
    EXPECT_EQ(calls.at(1).working_folder, _settings.target_root);
}

TEST_F(TestBuilderTest, CompileStopsAtFailingConfiguration) {
    FakeProcessRunner fake_runner(0U);
    fake_runner.setExitStatus("./waf", 1);
    const spin_testgen::builder::TestBuilder test_builder(_settings, fake_runner);
    EXPECT_THROW(test_builder.compile(), spin_testgen::exceptions::ExternalToolFailureException);
    EXPECT_EQ(fake_runner.getCalls().size(), 1U);
}

TEST_F(TestBuilderTest, RunInSimulator) {
    FakeProcessRunner fake_runner(0U);
    const spin_testgen::builder::TestBuilder test_builder(_settings, fake_runner);
    test_builder.execute(makeUserSettings(Verb::RUN));
    const auto& calls = fake_runner.getCalls();
    ASSERT_EQ(calls.size(), 1U);
    EXPECT_EQ(calls.front().command, "sparc-rtems6-sis");
    const std::vector<std::string> expected_args{"-nouartrx", "-leon3", "-r", "s", "-m", "2", "build/ts-model-0.exe"};
    EXPECT_EQ(calls.front().args, expected_args);
    EXPECT_EQ(calls.front().working_folder, _settings.simulator_folder);
}

TEST_F(TestBuilderTest, RunFailureIsReported) {
    FakeProcessRunner fake_runner(0U);
    fake_runner.setExitStatus("sparc-rtems6-sis", 5);
    const spin_testgen::builder::TestBuilder test_builder(_settings, fake_runner);
    EXPECT_THROW(test_builder.run(), spin_testgen::exceptions::ExternalToolFailureException);
}

TEST_F(TestBuilderTest, HelpSpawnsNothing) {
    FakeProcessRunner fake_runner(1U);
    const spin_testgen::builder::TestBuilder test_builder(_settings, fake_runner);
    test_builder.execute(makeUserSettings(Verb::HELP));
    EXPECT_TRUE(fake_runner.getCalls().empty());
}

/*
Generate the tests of two models, deploy them, clean the working folder and reset the manifest
*/
TEST_F(TestBuilderTest, FullWorkflow) {
    FakeProcessRunner fake_runner(2U, false);
    const spin_testgen::builder::TestBuilder test_builder(_settings, fake_runner);
    createReadinessSet(_settings.working_folder, "barrier");
    touchFile(_settings.working_folder / "tc-barrier.c", "test case");

    test_builder.execute(makeUserSettings(Verb::GENERATE, "barrier"));
    EXPECT_TRUE(std::filesystem::exists(_settings.working_folder / "tr-barrier-0.c"));
    EXPECT_TRUE(std::filesystem::exists(_settings.working_folder / "barrier-1.spn"));

    test_builder.execute(makeUserSettings(Verb::COPY, "barrier"));
    const std::vector<std::string> expected_target{"tc-barrier.c", "tr-barrier-0.c", "tr-barrier-1.c"};
    EXPECT_EQ(listFolder(_settings.test_code_folder), expected_target);
    const std::vector<std::string> expected_sources{
        "testsuites/validation/tc-barrier.c", "testsuites/validation/tr-barrier-0.c", "testsuites/validation/tr-barrier-1.c",
        "testsuites/validation/ts-model-0.c"};
    EXPECT_EQ(manifestSources(), expected_sources);

    test_builder.execute(makeUserSettings(Verb::CLEAN, "barrier"));
    const std::vector<std::string> expected_left{"barrier-post.h", "barrier-pre.h", "barrier-rfn.yml", "barrier-run.h",
                                                 "barrier.pml",    "tc-barrier.c"};
    EXPECT_EQ(listFolder(_settings.working_folder), expected_left);

    test_builder.execute(makeUserSettings(Verb::ZERO));
    EXPECT_EQ(manifestSources(), std::vector<std::string>{"testsuites/validation/ts-model-0.c"});
    // Zeroing only touches the manifest
    EXPECT_EQ(listFolder(_settings.test_code_folder), expected_target);
}

TEST_F(TestBuilderTest, GenerateWithoutReadinessSet) {
    FakeProcessRunner fake_runner(1U);
    const spin_testgen::builder::TestBuilder test_builder(_settings, fake_runner);
    EXPECT_THROW(
        test_builder.execute(makeUserSettings(Verb::GENERATE, "barrier")), spin_testgen::exceptions::MissingInputException);
    EXPECT_TRUE(fake_runner.getCalls().empty());
}

class CommandLineTest : public ::testing::Test {
  protected:
    void SetUp() override {
        _work_folder = std::filesystem::absolute(testFolderName());
        std::filesystem::remove_all(_work_folder);
        std::filesystem::create_directory(_work_folder);
        _config_file = _work_folder / "testbuilder.yml";
        touchFile(
            _config_file, "spin2test: spin2test\n"
                          "rtems: rtems\n"
                          "rsb: rsb\n"
                          "simulator: sparc-rtems6-sis\n"
                          "testyaml: rtems/spec/model-0.yml\n"
                          "testcode: rtems/testsuites/validation\n"
                          "testexe: ts-model-0.exe\n");
    }

    void TearDown() override {
        std::filesystem::remove_all(_work_folder);
    }

    // Run the program front end with the given arguments, the program name is added in front
    int runCommandLine(const std::vector<std::string>& cmd_args) {
        std::vector<std::string> all_args{"spin_testgen"};
        all_args.insert(all_args.end(), cmd_args.begin(), cmd_args.end());
        std::vector<char*> argv;
        for (auto& arg : all_args) {
            argv.emplace_back(arg.data());
        }
        return spin_testgen::builder::runCommandLine(static_cast<int>(argv.size()), argv.data(), _fake_runner, _out_stream, _err_stream);
    }

    std::filesystem::path _work_folder;
    std::filesystem::path _config_file;
    FakeProcessRunner _fake_runner{0U};
    std::ostringstream _out_stream;
    std::ostringstream _err_stream;
};

TEST_F(CommandLineTest, InvalidCommandLinePrintsUsage) {
    EXPECT_EQ(runCommandLine({"deploy"}), EXIT_FAILURE);
    EXPECT_NE(_out_stream.str().find("USAGE:"), std::string::npos);
    EXPECT_EQ(runCommandLine({"generate", "--config", _config_file.string()}), EXIT_FAILURE);
    EXPECT_EQ(runCommandLine({"compile", "extra-model", "--config", _config_file.string()}), EXIT_FAILURE);
    EXPECT_TRUE(_fake_runner.getCalls().empty());
    EXPECT_TRUE(_err_stream.str().empty());
}

TEST_F(CommandLineTest, MissingConfiguration) {
    const auto missing_config = (_work_folder / "missing.yml").string();
    EXPECT_EQ(runCommandLine({"help", "--config", missing_config}), EXIT_FAILURE);
    EXPECT_NE(_err_stream.str().find("spin_testgen help failed"), std::string::npos) << _err_stream.str();
}

TEST_F(CommandLineTest, SuccessfulVerb) {
    EXPECT_EQ(runCommandLine({"compile", "--config", _config_file.string()}), EXIT_SUCCESS);
    const auto& calls = _fake_runner.getCalls();
    ASSERT_EQ(calls.size(), 2U);
    EXPECT_EQ(calls.front().working_folder, _work_folder / "rtems");
    EXPECT_TRUE(_err_stream.str().empty());
}

TEST_F(CommandLineTest, FailingVerb) {
    _fake_runner.setExitStatus("./waf", 2);
    EXPECT_EQ(runCommandLine({"compile", "--config", _config_file.string()}), EXIT_FAILURE);
    EXPECT_NE(_err_stream.str().find("spin_testgen compile failed"), std::string::npos) << _err_stream.str();
    // Missing readiness set in the working folder
    EXPECT_EQ(runCommandLine({"generate", "barrier", "--config", _config_file.string(), "--workdir", _work_folder.string()}), EXIT_FAILURE);
    EXPECT_NE(_err_stream.str().find("spin_testgen generate failed"), std::string::npos) << _err_stream.str();
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    spin_testgen::utils::stormSetUp();
    return RUN_ALL_TESTS();
}
