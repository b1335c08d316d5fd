#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "core/Config.hpp"
#include "utils/ArgParser.hpp"

using namespace DmrScan;

// Helper to create dummy files
void create_dummy_file(const std::string& path) {
    std::ofstream ofs(path);
    ofs << "id\tchr\tpos\testimate\tse\n";
    ofs.close();
}

// Builds a mutable argv for ArgParser
class ArgvBuilder {
public:
    explicit ArgvBuilder(std::vector<std::string> args) : args_(std::move(args)) {
        for (auto& arg : args_) {
            ptrs_.push_back(&arg[0]);
        }
        ptrs_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> args_;
    std::vector<char*> ptrs_;
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        create_dummy_file("cfg_sites_a.tsv");
        create_dummy_file("cfg_meth_a.tsv");
        create_dummy_file("cfg_sites_b.tsv");
        create_dummy_file("cfg_meth_b.tsv");
    }

    void TearDown() override {
        std::remove("cfg_sites_a.tsv");
        std::remove("cfg_meth_a.tsv");
        std::remove("cfg_sites_b.tsv");
        std::remove("cfg_meth_b.tsv");
    }

    Config valid_config() const {
        Config config;
        config.site_paths = {"cfg_sites_a.tsv"};
        config.methylation_paths = {"cfg_meth_a.tsv"};
        return config;
    }
};

TEST_F(ConfigTest, ValidationSuccess) {
    Config config = valid_config();
    EXPECT_TRUE(config.validate());
    EXPECT_FALSE(config.is_meta());
}

TEST_F(ConfigTest, ValidationFailureMissingFiles) {
    Config config;
    // Site statistics are required
    EXPECT_FALSE(config.validate());

    config.site_paths = {"does_not_exist.tsv"};
    config.methylation_paths = {"cfg_meth_a.tsv"};
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, ValidationFailureUnpairedInputs) {
    Config config = valid_config();
    config.site_paths.push_back("cfg_sites_b.tsv");
    EXPECT_FALSE(config.validate());

    config.methylation_paths.push_back("cfg_meth_b.tsv");
    EXPECT_TRUE(config.validate());
    EXPECT_TRUE(config.is_meta());
}

TEST_F(ConfigTest, ValidationFailureInvalidParameters) {
    Config config = valid_config();
    config.window = 0;
    EXPECT_FALSE(config.validate());

    config = valid_config();
    config.p_cutoff = 0.0;
    EXPECT_FALSE(config.validate());

    config = valid_config();
    config.max_gap = -1;
    EXPECT_FALSE(config.validate());

    config = valid_config();
    config.regularizer = 0.9;
    EXPECT_FALSE(config.validate());

    config = valid_config();
    config.min_sites = 0;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, DefaultValues) {
    Config config;
    EXPECT_EQ(config.max_gap, 500);
    EXPECT_DOUBLE_EQ(config.p_cutoff, 0.05);
    EXPECT_EQ(config.window, 20);
    EXPECT_DOUBLE_EQ(config.regularizer, 1.05);
    EXPECT_EQ(config.adjust_method, AdjustMethod::BONFERRONI);
    EXPECT_EQ(config.min_sites, 1);
    EXPECT_EQ(config.output_dir, "output");
    EXPECT_EQ(config.log_level, LogLevel::LOG_INFO);
    EXPECT_FALSE(config.is_debug());
}

TEST_F(ConfigTest, ArgParserPopulatesConfig) {
    ArgvBuilder args({"dmrscan", "-s", "cfg_sites_a.tsv", "-m", "cfg_meth_a.tsv", "-s", "cfg_sites_b.tsv", "-m",
                      "cfg_meth_b.tsv", "-o", "results", "-g", "750", "-p", "0.01", "-W", "8", "--regularizer",
                      "1.1", "--adjust", "FDR", "--min-sites", "2", "-j", "2", "--log-level", "debug"});

    Config config;
    ASSERT_TRUE(Utils::ArgParser::parse(args.argc(), args.argv(), config));

    ASSERT_EQ(config.site_paths.size(), 2u);
    EXPECT_EQ(config.site_paths[1], "cfg_sites_b.tsv");
    ASSERT_EQ(config.methylation_paths.size(), 2u);
    EXPECT_EQ(config.output_dir, "results");
    EXPECT_EQ(config.max_gap, 750);
    EXPECT_DOUBLE_EQ(config.p_cutoff, 0.01);
    EXPECT_EQ(config.window, 8);
    EXPECT_DOUBLE_EQ(config.regularizer, 1.1);
    EXPECT_EQ(config.adjust_method, AdjustMethod::FDR);
    EXPECT_EQ(config.min_sites, 2);
    EXPECT_EQ(config.threads, 2);
    EXPECT_TRUE(config.is_debug());
    EXPECT_TRUE(config.is_meta());
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, ArgParserRejectsMissingRequired) {
    ArgvBuilder args({"dmrscan", "-m", "cfg_meth_a.tsv"});
    Config config;
    EXPECT_FALSE(Utils::ArgParser::parse(args.argc(), args.argv(), config));
}

TEST_F(ConfigTest, ArgParserRejectsUnknownAdjustment) {
    ArgvBuilder args({"dmrscan", "-s", "cfg_sites_a.tsv", "-m", "cfg_meth_a.tsv", "--adjust", "holm"});
    Config config;
    EXPECT_FALSE(Utils::ArgParser::parse(args.argc(), args.argv(), config));
}
