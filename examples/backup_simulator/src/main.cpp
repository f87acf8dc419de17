#include "backup_simulator.hpp"
#include "options.hpp"

// xferstat
#include "base/init.hpp"
#include "xfer/base/time/clock.hpp"
#include "xfer/base/task_utils/task_queue.hpp"
#include "xfer/progress/log_progress_sink.hpp"
#include "xfer/progress/progress_reporter.hpp"
#include "xfer/progress/transfer_progress_estimator.hpp"

#include <plog/Log.h>

#include <cstdlib>
#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    std::optional<backup_simulator::Options> options;
    try {
        options = backup_simulator::ParseOptions(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    if (!options) {
        return EXIT_SUCCESS;
    }

    xferstat::Init(options->verbose ? xferstat::LoggingLevel::VERBOSE : xferstat::LoggingLevel::INFO);

    try {
        auto clock = xferstat::Clock::GetRealTimeClock();
        xferstat::TaskQueue task_queue("progress");
        backup_simulator::BackupSimulator simulator(*options);
        xferstat::TransferProgressEstimator estimator(options->progress, clock.get());
        xferstat::LogProgressSink sink;

        // Evidence pass
        xferstat::SizeEvidence evidence = simulator.CollectEvidence();
        estimator.SetEvidence(evidence);
        PLOG_INFO << "Evidence collected: " << evidence.new_file_bytes << " new bytes, "
                  << evidence.changed_file_bytes << " changed bytes.";

        if (options->progress.dry_run) {
            PLOG_INFO << "Dry run, nothing transferred.";
            return EXIT_SUCCESS;
        }

        // Live pass
        xferstat::ProgressReporter reporter(options->progress, 
                                            &estimator, 
                                            [&simulator](){ return simulator.CurrentStats(); }, 
                                            &sink, 
                                            clock.get(), 
                                            task_queue.Get());
        const bool reporting = reporter.Start();
        simulator.RunLivePass(reporter.TransferCallback());
        reporter.Stop();
        if (reporting && !reporter.WaitForStopped(options->progress.reporting_interval * 2)) {
            PLOG_WARNING << "Progress reporter did not stop in time.";
        }
        PLOG_INFO << "Backup done: " << simulator.written_bytes() << " bytes written in " 
                  << simulator.num_volumes() << " volume(s).";
    } catch (const std::exception& e) {
        PLOG_ERROR << e.what();
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
