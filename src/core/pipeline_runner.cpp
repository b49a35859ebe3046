#include "core/pipeline_runner.hpp"
#include "core/content_hasher.hpp"
#include "core/file_utils.hpp"
#include "core/path_planner.hpp"
#include "core/relocator.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <sstream>

std::string RunReport::summary() const
{
    std::stringstream ss;
    ss << PipelineStates::getName(state) << ": " << processed << "/" << total << " processed, "
       << organized << " organized, " << quarantined << " quarantined, "
       << skipped << " skipped, " << failed << " failed";
    if (!failure_message.empty())
    {
        ss << " (" << failure_message << ")";
    }
    return ss.str();
}

PipelineRunner::PipelineRunner(MetadataResolver &resolver, GeocodeCache &geocode_cache)
    : resolver_(resolver), geocode_cache_(geocode_cache)
{
}

RunState PipelineRunner::getRunState() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void PipelineRunner::setState(PipelineState state, const std::string &status_message)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.state = state;
    state_.paused = state == PipelineState::PAUSED;
    state_.status_message = status_message;
}

void PipelineRunner::emitLog(const RunCallbacks &callbacks, bool is_error, const std::string &message)
{
    if (is_error)
        Logger::error(message);
    else
        Logger::info(message);
    if (callbacks.on_log)
        callbacks.on_log(message);
}

RunReport PipelineRunner::finish(RunReport report, PipelineState state, const RunCallbacks &callbacks)
{
    report.state = state;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.state = state;
        state_.paused = false;
        state_.cancelled = state == PipelineState::CANCELLED;
        state_.status_message = PipelineStates::getName(state);
    }
    emitLog(callbacks, state == PipelineState::FAILED, "Run finished - " + report.summary());
    if (callbacks.on_status)
        callbacks.on_status(PipelineStates::getName(state));
    return report;
}

RunReport PipelineRunner::run(const std::string &input_dir, const std::string &output_dir,
                              const std::string &trash_dir, const PipelineOptions &options,
                              const RunCallbacks &callbacks, RunControls &controls)
{
    RunReport report;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = RunState();
        state_.state = PipelineState::RUNNING;
        state_.status_message = "Starting";
    }

    try
    {
        if (!FileUtils::isValidDirectory(input_dir))
        {
            report.failure_message = "Input directory does not exist: " + input_dir;
            return finish(report, PipelineState::FAILED, callbacks);
        }
        std::string dir_error;
        if (!FileUtils::ensureDirectory(output_dir, &dir_error) || !FileUtils::ensureDirectory(trash_dir, &dir_error))
        {
            report.failure_message = dir_error;
            return finish(report, PipelineState::FAILED, callbacks);
        }

        std::string scan_error;
        std::vector<std::string> files = FileUtils::collectFiles(input_dir, &scan_error);
        if (!scan_error.empty())
        {
            report.failure_message = scan_error;
            return finish(report, PipelineState::FAILED, callbacks);
        }

        report.total = files.size();
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_.total = files.size();
        }
        emitLog(callbacks, false,
                "Organizing " + std::to_string(files.size()) + " files from " + input_dir + " (strategy=" +
                    DuplicateStrategies::getName(options.duplicate_strategy) + ", naming=" +
                    NamingConventions::getName(options.naming_convention) + ")");

        DuplicateRegistry registry;
        for (const auto &file_path : files)
        {
            if (controls.isPaused() && !controls.isCancelled())
            {
                setState(PipelineState::PAUSED, "Paused");
                if (callbacks.on_status)
                    callbacks.on_status("Paused");
                Logger::info("Pipeline paused before " + file_path);
            }
            if (!controls.waitWhilePaused())
            {
                return finish(report, PipelineState::CANCELLED, callbacks);
            }
            setState(PipelineState::RUNNING, std::filesystem::path(file_path).filename().string());

            FileOutcome outcome;
            try
            {
                outcome = processFile(file_path, output_dir, trash_dir, options, registry);
            }
            catch (const std::exception &e)
            {
                outcome.source_path = file_path;
                outcome.outcome = Outcome::FAILED;
                outcome.error_kind = ErrorKind::IO_FAILURE;
                outcome.message = std::string("Unexpected error: ") + e.what();
            }

            switch (outcome.outcome)
            {
            case Outcome::ORGANIZED:
                report.organized++;
                break;
            case Outcome::QUARANTINED:
                report.quarantined++;
                break;
            case Outcome::SKIPPED:
                report.skipped++;
                break;
            case Outcome::FAILED:
                report.failed++;
                break;
            }
            emitLog(callbacks, outcome.outcome == Outcome::FAILED,
                    Outcomes::getName(outcome.outcome) + " " + file_path +
                        (outcome.final_path.empty() ? "" : " -> " + outcome.final_path) +
                        (outcome.message.empty() ? "" : " (" + outcome.message + ")"));
            report.outcomes.push_back(outcome);
            report.processed++;

            std::string filename = std::filesystem::path(file_path).filename().string();
            int percent = static_cast<int>(report.processed * 100 / report.total);
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                state_.processed = report.processed;
                state_.status_message = filename;
            }
            if (callbacks.on_progress)
                callbacks.on_progress(percent);
            if (callbacks.on_status)
                callbacks.on_status(filename);
        }

        return finish(report, PipelineState::COMPLETED, callbacks);
    }
    catch (const std::exception &e)
    {
        report.failure_message = std::string("Run aborted: ") + e.what();
        return finish(report, PipelineState::FAILED, callbacks);
    }
    catch (...)
    {
        report.failure_message = "Run aborted by unknown exception";
        return finish(report, PipelineState::FAILED, callbacks);
    }
}

std::future<RunReport> PipelineRunner::runAsync(const std::string &input_dir, const std::string &output_dir,
                                                const std::string &trash_dir, const PipelineOptions &options,
                                                const RunCallbacks &callbacks, RunControls &controls)
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = RunState();
        state_.state = PipelineState::RUNNING;
        state_.status_message = "Starting";
    }
    return std::async(std::launch::async, [this, input_dir, output_dir, trash_dir, options, callbacks, &controls]()
                      { return run(input_dir, output_dir, trash_dir, options, callbacks, controls); });
}

FileOutcome PipelineRunner::processFile(const std::string &file_path, const std::string &output_dir,
                                        const std::string &trash_dir, const PipelineOptions &options,
                                        DuplicateRegistry &registry)
{
    FileOutcome outcome;
    outcome.source_path = file_path;

    auto media = FileUtils::getMediaFile(file_path, options.media_extensions);
    if (!media)
    {
        outcome.outcome = Outcome::FAILED;
        outcome.error_kind = ErrorKind::IO_FAILURE;
        outcome.message = "File disappeared or is not a regular file";
        return outcome;
    }

    std::string ext = FileUtils::getFileExtension(file_path);
    if (media->kind == MediaKind::UNSUPPORTED ||
        (options.included_extensions && options.included_extensions->count(ext) == 0))
    {
        outcome.outcome = Outcome::SKIPPED;
        outcome.error_kind = ErrorKind::UNSUPPORTED_CONTENT;
        outcome.message = "Unsupported extension '" + ext + "'";
        return outcome;
    }

    // Perceptual hashing is defined for images only
    DuplicateStrategy strategy = media->kind == MediaKind::VIDEO ? DuplicateStrategy::EXACT : options.duplicate_strategy;
    HashResult hash = ContentHasher::fingerprint(media->path, strategy, options.chunk_size);
    if (!hash.success)
    {
        Logger::warn("Fingerprint failed (" + ErrorKinds::getName(hash.error_kind) + "), treating as original: " +
                     hash.error_message);
    }
    else if (registry.classify(hash.fingerprint) == Classification::DUPLICATE)
    {
        RelocationResult moved = Relocator::quarantine(media->path, trash_dir);
        if (!moved.success)
        {
            outcome.outcome = Outcome::FAILED;
            outcome.error_kind = moved.error_kind;
            outcome.message = moved.error_message;
            return outcome;
        }
        outcome.outcome = Outcome::QUARANTINED;
        outcome.final_path = moved.final_path;
        outcome.message = "duplicate of " + hash.fingerprint.key();
        return outcome;
    }

    MetadataResult metadata = resolver_.extract(*media);
    if (!metadata.success)
    {
        outcome.outcome = Outcome::SKIPPED;
        outcome.error_kind = metadata.error_kind;
        outcome.message = metadata.error_message;
        return outcome;
    }

    ResolvedLocation location;
    if (media->kind == MediaKind::IMAGE)
    {
        location = geocode_cache_.resolve(metadata.metadata.gps);
    }

    Destination destination = PathPlanner::plan(metadata.metadata.timestamp, location, output_dir,
                                                options.naming_convention, *media);
    RelocationResult moved = Relocator::place(media->path, destination);
    if (!moved.success)
    {
        outcome.outcome = Outcome::FAILED;
        outcome.error_kind = moved.error_kind;
        outcome.message = moved.error_message;
        return outcome;
    }

    outcome.outcome = Outcome::ORGANIZED;
    outcome.final_path = moved.final_path;
    if (metadata.timestamp_from_filesystem)
        outcome.message = "date from modification time";
    return outcome;
}
