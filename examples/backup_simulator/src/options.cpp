#include "options.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <stdexcept>

namespace po = boost::program_options;

namespace backup_simulator {
namespace {

void CheckPositive(double value, const char* option) {
    if (!(value > 0)) {
        throw std::invalid_argument(std::string("--") + option + " must be positive");
    }
}
    
} // namespace

std::optional<Options> ParseOptions(int argc, char* argv[]) {
    Options options;
    auto odesc = po::options_description{"Options"};
    odesc.add_options()
        ("help,h", "Show this help")
        ("progress", "Report the progress of the transfer")
        ("progress-rate",
            po::value<double>()->value_name("<sec>")->default_value(3.0),
            "Delay between two progress reports")
        ("dry-run", "Collect the evidence only, transfer nothing")
        ("new-bytes",
            po::value<uint64_t>()->value_name("<bytes>")->default_value(options.new_bytes),
            "Size of the new files")
        ("changed-bytes",
            po::value<uint64_t>()->value_name("<bytes>")->default_value(options.changed_bytes),
            "Size of the changed files")
        ("delta-ratio",
            po::value<double>()->value_name("<ratio>")->default_value(options.delta_ratio),
            "Delta bytes produced per changed byte")
        ("compress-ratio",
            po::value<double>()->value_name("<ratio>")->default_value(options.compress_ratio),
            "Written bytes per delta byte")
        ("rate",
            po::value<uint64_t>()->value_name("<bytes/sec>")->default_value(options.rate),
            "Source bytes processed per second")
        ("volume-size",
            po::value<uint64_t>()->value_name("<bytes>")->default_value(options.volume_size),
            "Size of a backup volume")
        ("verbose,v", "Enable verbose logging");

    auto vm = po::variables_map{};
    po::store(po::parse_command_line(argc, argv, odesc), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << "Usage: backup_simulator [options]\n" << odesc << std::endl;
        return std::nullopt;
    }

    const double progress_rate = vm.at("progress-rate").as<double>();
    CheckPositive(progress_rate, "progress-rate");
    options.progress.enabled = vm.count("progress") > 0;
    options.progress.dry_run = vm.count("dry-run") > 0;
    options.progress.reporting_interval = xferstat::TimeDelta::Seconds(progress_rate);

    options.new_bytes = vm.at("new-bytes").as<uint64_t>();
    options.changed_bytes = vm.at("changed-bytes").as<uint64_t>();
    options.delta_ratio = vm.at("delta-ratio").as<double>();
    CheckPositive(options.delta_ratio, "delta-ratio");
    options.compress_ratio = vm.at("compress-ratio").as<double>();
    CheckPositive(options.compress_ratio, "compress-ratio");
    options.rate = vm.at("rate").as<uint64_t>();
    CheckPositive(static_cast<double>(options.rate), "rate");
    options.volume_size = vm.at("volume-size").as<uint64_t>();
    CheckPositive(static_cast<double>(options.volume_size), "volume-size");
    options.verbose = vm.count("verbose") > 0;
    return options;
}

} // namespace backup_simulator
