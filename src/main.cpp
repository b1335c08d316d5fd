#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "core/Config.hpp"
#include "core/DmrPipeline.hpp"
#include "core/PreparedDataset.hpp"
#include "io/ResultWriter.hpp"
#include "io/TableReader.hpp"
#include "utils/ArgParser.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

int main(int argc, char** argv) {
    DmrScan::Utils::ResourceMonitor monitor;

    DmrScan::Config config;

    if (!DmrScan::Utils::ArgParser::parse(argc, argv, config)) {
        return 1;  // Parse failed or help printed
    }

    // Configure Logger
    auto& logger = DmrScan::Utils::Logger::instance();
    logger.set_log_level(config.log_level);

    if (!config.validate()) {
        LOG_ERROR("Configuration validation failed.");
        return 1;
    }

    if (config.log_level >= DmrScan::LogLevel::LOG_INFO) {
        config.print();
    }

    try {
        if (!config.log_file.empty()) {
            logger.set_log_file(config.log_file);
        }

        DmrScan::DmrPipeline pipeline(DmrScan::PipelineOptions::from_config(config));
        DmrScan::ResultWriter writer(config.output_dir);

        DmrScan::Utils::ScopedLogger main_scope("Main Execution");

        LOG_INFO("[0] Loading " + std::to_string(config.site_paths.size()) + " dataset(s)...");
        std::vector<DmrScan::PreparedDataset> datasets;
        datasets.reserve(config.site_paths.size());
        for (size_t i = 0; i < config.site_paths.size(); ++i) {
            auto sites = DmrScan::read_sites(config.site_paths[i]);
            auto table = DmrScan::read_measurements(config.methylation_paths[i]);
            auto matrix = DmrScan::align_measurements(table, sites);
            datasets.push_back(pipeline.prepare(sites, matrix));
        }

        std::vector<DmrScan::DmrRecord> dmrs;
        if (config.is_meta()) {
            auto result = pipeline.run_meta(datasets);
            writer.write_combined_sites(result.sites);
            dmrs = std::move(result.dmrs);
        } else {
            dmrs = pipeline.run_cohort(datasets.front());
        }

        writer.write_dmrs(dmrs, config.min_sites);
        pipeline.print_summary(dmrs);

        LOG_INFO("Output directory: " + config.output_dir);

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    monitor.print_stats("Total Execution");

    return 0;
}
