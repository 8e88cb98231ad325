#include "pc/core/util/Logging.hpp"
#include "pc/core/util/MaskStack.hpp"
#include "pc/core/util/OptimizerParams.hpp"
#include "pc/core/util/Progress.hpp"
#include "pc/core/util/RadiusOptimizer.hpp"
#include "pc/core/util/ResultsIO.hpp"
#include <boost/program_options.hpp>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <thread>

namespace po = boost::program_options;
namespace fs = std::filesystem;

static pc::CancellationToken g_cancel;

static void on_sigint(int)
{
    g_cancel.cancel();
}

int main(int argc, char** argv)
{
    po::options_description desc("Find the erosion radius that best splits a binarized CT mask stack into particles.");
    desc.add_options()
        ("help,h", "Print help")
        ("input,i", po::value<std::string>(), "Directory of binarized mask slices (required)")
        ("output,o", po::value<std::string>(), "Output directory (required)")
        ("config,c", po::value<std::string>(), "Optimizer configuration (.json)")
        ("r-min", po::value<int>(), "Smallest erosion radius to test")
        ("r-max", po::value<int>(), "Largest erosion radius to test")
        ("seed-connectivity", po::value<int>(), "Seed labeling connectivity (6, 18, 26)")
        ("contact-connectivity", po::value<int>(), "Contact counting connectivity (6, 18, 26)")
        ("tau-ratio", po::value<double>(), "Max largest-particle volume ratio")
        ("contacts-min", po::value<double>(), "Lower bound of the plausible mean contact range")
        ("contacts-max", po::value<double>(), "Upper bound of the plausible mean contact range")
        ("smoothing-window", po::value<int>(), "Moving average window over particle counts")
        ("invert", po::bool_switch()->default_value(false), "Treat zero pixels as foreground")
        ("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warn, error, critical, off")
        ("log-file", po::value<std::string>(), "Also append log lines to this file");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }

    if (!vm.count("input") || !vm.count("output")) {
        std::cerr << "Error: --input and --output are required." << std::endl;
        return 1;
    }

    if (!pc::SetLogLevel(vm["log-level"].as<std::string>())) {
        std::cerr << "Error: unknown log level " << vm["log-level"].as<std::string>() << std::endl;
        return 1;
    }
    if (vm.count("log-file") && !pc::AddLogFile(vm["log-file"].as<std::string>())) {
        std::cerr << "Error: cannot open log file " << vm["log-file"].as<std::string>() << std::endl;
        return 1;
    }

    const fs::path input_dir = vm["input"].as<std::string>();
    const fs::path output_dir = vm["output"].as<std::string>();

    pc::OptimizerParams params;
    pc::Volume volume;
    try {
        if (vm.count("config")) {
            params = pc::loadOptimizerParams(vm["config"].as<std::string>());
        }
        if (vm.count("r-min") || vm.count("r-max")) {
            const int r_min = vm.count("r-min") ? vm["r-min"].as<int>() : params.radii.front();
            const int r_max = vm.count("r-max") ? vm["r-max"].as<int>() : params.radii.back();
            params.radii = pc::radiusRange(r_min, r_max);
        }
        if (vm.count("seed-connectivity"))
            params.split.seedConnectivity = pc::connectivityFromInt(vm["seed-connectivity"].as<int>());
        if (vm.count("contact-connectivity"))
            params.contactConnectivity = pc::connectivityFromInt(vm["contact-connectivity"].as<int>());
        if (vm.count("tau-ratio"))
            params.selection.tauRatio = vm["tau-ratio"].as<double>();
        if (vm.count("contacts-min"))
            params.selection.contactsMin = vm["contacts-min"].as<double>();
        if (vm.count("contacts-max"))
            params.selection.contactsMax = vm["contacts-max"].as<double>();
        if (vm.count("smoothing-window"))
            params.selection.smoothingWindow = vm["smoothing-window"].as<int>();
        params.validate();

        volume = pc::loadMaskStack(input_dir, vm["invert"].as<bool>());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, on_sigint);

    pc::ProgressQueue queue;
    pc::OptimizationOutcome outcome;
    std::thread worker([&] {
        outcome = pc::runOptimization(volume, params, queue.callback(), &g_cancel);
        queue.close();
    });

    while (true) {
        auto event = queue.pop(std::chrono::milliseconds(200));
        if (event) {
            std::cout << std::fixed << std::setprecision(1)
                      << "[" << event->percentComplete << "%] r=" << event->radius
                      << " particles=" << event->particleCount
                      << std::setprecision(3)
                      << " largest_ratio=" << event->largestParticleRatio
                      << std::setprecision(2)
                      << " mean_contacts=" << event->meanContacts << std::endl;
        } else if (queue.closed()) {
            break;
        }
    }
    worker.join();
    std::signal(SIGINT, SIG_DFL);

    switch (outcome.status) {
        case pc::OptimizationOutcome::Status::Cancelled:
            std::cerr << "Cancelled: " << outcome.message << std::endl;
            return 2;
        case pc::OptimizationOutcome::Status::Failed:
            std::cerr << "Error: " << outcome.message << std::endl;
            return 1;
        case pc::OptimizationOutcome::Status::Completed:
            break;
    }

    try {
        pc::exportResults(*outcome.summary, params, output_dir);
    } catch (const std::exception& e) {
        std::cerr << "Error: failed to write results: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Best radius: " << outcome.summary->bestRadius
              << " (" << pc::toString(outcome.summary->method) << ", " << outcome.summary->reason << ")"
              << std::endl;
    std::cout << outcome.summary->explanation << std::endl;
    return 0;
}
