#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "rally/app/cli_runner.hpp"

using namespace rally::app;
using rally::foundation::ErrorCode;

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

namespace {

rally::foundation::RallyResult<CliOptions> parse(std::vector<std::string_view> args) {
    return parseCliArgs(args);
}

} // namespace

TEST(CliArgsTest, CommandAndFile) {
    auto options = parse({"rank", "matches.csv"});
    ASSERT_TRUE(options.hasValue());
    EXPECT_EQ(options.value().command, Command::Rank);
    EXPECT_EQ(options.value().matchesPath, "matches.csv");
    EXPECT_TRUE(options.value().configPath.empty());
    EXPECT_EQ(options.value().source, SkillSource::Contextual);
}

TEST(CliArgsTest, AllOptions) {
    auto options = parse({"synergy", "--config", "rally.yaml", "m.csv", "--ratings", "seed.csv",
                          "--save-ratings", "out.csv", "--source", "trueskill"});
    ASSERT_TRUE(options.hasValue());
    const auto& o = options.value();
    EXPECT_EQ(o.command, Command::Synergy);
    EXPECT_EQ(o.matchesPath, "m.csv");
    EXPECT_EQ(o.configPath, "rally.yaml");
    ASSERT_TRUE(o.seedRatingsPath.has_value());
    EXPECT_EQ(*o.seedRatingsPath, "seed.csv");
    ASSERT_TRUE(o.saveRatingsPath.has_value());
    EXPECT_EQ(*o.saveRatingsPath, "out.csv");
    EXPECT_EQ(o.source, SkillSource::TrueSkill);
}

TEST(CliArgsTest, UsageErrors) {
    for (const auto& args : std::vector<std::vector<std::string_view>>{
             {},
             {"rank"},
             {"tally", "m.csv"},
             {"rank", "m.csv", "extra"},
             {"rank", "m.csv", "--source", "elo"},
             {"rank", "m.csv", "--verbose", "yes"},
             {"rank", "m.csv", "--config"},
         }) {
        auto options = parse(args);
        ASSERT_TRUE(options.hasError());
        EXPECT_EQ(options.error().code(), ErrorCode::InvalidArgument);
    }
    EXPECT_FALSE(usage().empty());
}

// ---------------------------------------------------------------------------
// Commands against a match file
// ---------------------------------------------------------------------------

class CliRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = std::filesystem::temp_directory_path() /
                  (std::string("rally_cli_test_") + info->name());
        std::filesystem::create_directories(tmpDir_);
        config_.expectedGamesPerMatch = 0;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeFile(const std::string& name, const std::string& content) {
        auto path = tmpDir_ / name;
        std::ofstream ofs(path, std::ios::binary);
        ofs << content;
        return path;
    }

    std::filesystem::path writeMatches(const std::string& rows) {
        return writeFile("matches.csv",
                         "match_id,game_id,match_date,team1_name,team2_name,partner1,partner2,"
                         "opponent1,opponent2,team1_points,team2_points\n" +
                             rows);
    }

    std::string run(Command command, const std::filesystem::path& matches,
                    SkillSource source = SkillSource::Contextual) {
        CliOptions options;
        options.command = command;
        options.matchesPath = matches;
        options.source = source;
        std::ostringstream out;
        auto result = runCommand(options, config_, out);
        EXPECT_TRUE(result.hasValue());
        return out.str();
    }

    AppConfig config_;
    std::filesystem::path tmpDir_;
};

TEST_F(CliRunnerTest, RankSingleGame) {
    config_.policy.narrowMargin = 10;
    auto matches = writeMatches("M1,1,2024-01-10,Home,Away,A,B,C,D,11,2\n");

    EXPECT_EQ(run(Command::Rank, matches),
              "Rank,Player,Rating\n1,A,3.52\n2,B,3.52\n3,C,3.48\n4,D,3.48\n");
}

TEST_F(CliRunnerTest, RankSkipsForfeitsAndSavesRatings) {
    auto matches = writeMatches(
        "M1,1,2024-01-10,Home,Away,A,B,C,D,11,2\n"
        "M1,2,2024-01-10,Home,Away,A,DEFAULT,C,D,,\n");

    CliOptions options;
    options.command = Command::Rank;
    options.matchesPath = matches;
    options.saveRatingsPath = tmpDir_ / "final.csv";
    std::ostringstream out;
    ASSERT_TRUE(runCommand(options, config_, out).hasValue());

    std::ifstream saved(*options.saveRatingsPath);
    std::string header;
    std::getline(saved, header);
    EXPECT_EQ(header, "Player,Rating");
    std::size_t lines = 0;
    for (std::string line; std::getline(saved, line);) {
        ++lines;
    }
    EXPECT_EQ(lines, 4u);
}

TEST_F(CliRunnerTest, RankStartsFromSeedRatings) {
    auto matches = writeMatches("M1,1,2024-01-10,Home,Away,A,B,C,D,11,10\n");
    auto seed = writeFile("seed.csv", "Player,Rating\nA,3.0\nB,3.0\nC,3.8\nD,3.8\n");

    CliOptions options;
    options.command = Command::Rank;
    options.matchesPath = matches;
    options.seedRatingsPath = seed;
    std::ostringstream out;
    ASSERT_TRUE(runCommand(options, config_, out).hasValue());

    // Heavy underdogs winning narrowly move by 0.0035 * 25 / 2.
    EXPECT_EQ(out.str(), "Rank,Player,Rating\n1,C,3.76\n2,D,3.76\n3,A,3.04\n4,B,3.04\n");
}

TEST_F(CliRunnerTest, PoolsReport) {
    auto matches = writeMatches(
        "M1,1,2024-01-10,Home,Away,A,B,C,D,11,2\n"
        "M2,1,2024-01-10,North,South,P,Q,R,S,11,9\n");
    EXPECT_EQ(run(Command::Pools, matches),
              "Found 2 disconnected player pools.\n"
              "Pool 1 - 4 players: A, B, C, D\n"
              "Pool 2 - 4 players: P, Q, R, S\n");
}

TEST_F(CliRunnerTest, SkillTableFromTrueSkill) {
    auto matches = writeMatches("M1,1,2024-01-10,Home,Away,A,B,C,D,11,2\n");
    auto text = run(Command::Skill, matches);

    std::istringstream lines(text);
    std::string line;
    std::getline(lines, line);
    EXPECT_EQ(line, "Rank,Player,Mu,Sigma");
    std::getline(lines, line);
    EXPECT_EQ(line.rfind("1,A,27.", 0), 0u) << line;
}

TEST_F(CliRunnerTest, SynergyFromBothSources) {
    auto matches = writeMatches(
        "M1,1,2024-01-10,Home,Away,A,B,C,D,11,2\n"
        "M1,2,2024-01-10,Home,Away,A,B,C,D,11,9\n");

    for (auto source : {SkillSource::Contextual, SkillSource::TrueSkill}) {
        auto text = run(Command::Synergy, matches, source);
        std::istringstream lines(text);
        std::string line;
        std::getline(lines, line);
        EXPECT_EQ(line,
                  "Rank,Partnership,Player1,Player2,Team,Synergy_Score,Win_Rate,Games,"
                  "Individual_Strength");
        std::getline(lines, line);
        EXPECT_EQ(line.rfind("1,A + B,A,B,Home,", 0), 0u) << line;
        std::getline(lines, line);
        EXPECT_EQ(line.rfind("2,C + D,C,D,Away,", 0), 0u) << line;
    }
}

TEST_F(CliRunnerTest, FatalRecordFailsTheRun) {
    auto matches = writeMatches(
        "M1,1,2024-01-10,Home,Away,A,B,C,D,11,2\n"
        "M1,2,2024-01-10,Home,Away,A,B,C,D,7,7\n");

    CliOptions options;
    options.command = Command::Rank;
    options.matchesPath = matches;
    std::ostringstream out;
    auto result = runCommand(options, config_, out);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TiedScore);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CliRunnerTest, MissingMatchFile) {
    CliOptions options;
    options.matchesPath = tmpDir_ / "absent.csv";
    std::ostringstream out;
    auto result = runCommand(options, config_, out);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::FileOpenFailed);
}
