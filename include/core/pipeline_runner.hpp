#pragma once

#include "core/duplicate_registry.hpp"
#include "core/duplicate_strategy.hpp"
#include "core/file_utils.hpp"
#include "core/media_types.hpp"
#include "core/metadata_resolver.hpp"
#include "core/naming_convention.hpp"
#include "core/run_controls.hpp"
#include "geocode/geocode_cache.hpp"
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Lifecycle of a pipeline run
 *
 * IDLE -> RUNNING -> (PAUSED <-> RUNNING) -> COMPLETED | CANCELLED | FAILED
 */
enum class PipelineState
{
    IDLE,
    RUNNING,
    PAUSED,
    COMPLETED,
    CANCELLED,
    FAILED
};

class PipelineStates
{
public:
    static std::string getName(PipelineState state)
    {
        switch (state)
        {
        case PipelineState::IDLE:
            return "IDLE";
        case PipelineState::RUNNING:
            return "RUNNING";
        case PipelineState::PAUSED:
            return "PAUSED";
        case PipelineState::COMPLETED:
            return "COMPLETED";
        case PipelineState::CANCELLED:
            return "CANCELLED";
        case PipelineState::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
        }
    }
};

enum class Outcome
{
    ORGANIZED,   // moved into the organized tree
    QUARANTINED, // duplicate moved to the trash root
    SKIPPED,     // left in place (unsupported or unreadable metadata)
    FAILED       // left in place after an error
};

class Outcomes
{
public:
    static std::string getName(Outcome outcome)
    {
        switch (outcome)
        {
        case Outcome::ORGANIZED:
            return "ORGANIZED";
        case Outcome::QUARANTINED:
            return "QUARANTINED";
        case Outcome::SKIPPED:
            return "SKIPPED";
        case Outcome::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
        }
    }
};

struct PipelineOptions
{
    DuplicateStrategy duplicate_strategy = DuplicateStrategy::EXACT;
    NamingConvention naming_convention = NamingConvention::DATE_LOCATION;
    MediaExtensions media_extensions = MediaExtensions::defaults();
    // Lowercase, no dot. Unset processes every classified file; an empty set processes nothing
    std::optional<std::set<std::string>> included_extensions;
    size_t chunk_size = ContentHasher::DEFAULT_CHUNK_SIZE;
};

/**
 * @brief Outbound notifications; each one is optional and invoked on the worker thread
 */
struct RunCallbacks
{
    std::function<void(const std::string &)> on_log;
    std::function<void(int)> on_progress; // integer percent
    std::function<void(const std::string &)> on_status;
};

struct RunState
{
    size_t processed = 0;
    size_t total = 0;
    bool paused = false;
    bool cancelled = false;
    std::string status_message;
    PipelineState state = PipelineState::IDLE;
};

struct FileOutcome
{
    std::string source_path;
    Outcome outcome = Outcome::SKIPPED;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string final_path;
    std::string message;
};

struct RunReport
{
    PipelineState state = PipelineState::IDLE;
    size_t total = 0;
    size_t processed = 0;
    size_t organized = 0;
    size_t quarantined = 0;
    size_t skipped = 0;
    size_t failed = 0;
    std::vector<FileOutcome> outcomes;
    std::string failure_message;

    std::string summary() const;
};

/**
 * @brief Sequential media organization over one directory tree
 *
 * For each file: fingerprint and classify, quarantine duplicates, resolve
 * metadata and place, then plan and move. Per-file errors are recorded and
 * the run continues. Pause and cancel are honoured at file boundaries only.
 */
class PipelineRunner
{
public:
    PipelineRunner(MetadataResolver &resolver, GeocodeCache &geocode_cache);

    /**
     * @brief Organize input_dir into output_dir, moving duplicates to trash_dir
     * @return Report with the terminal state and every per-file outcome
     */
    RunReport run(const std::string &input_dir, const std::string &output_dir, const std::string &trash_dir,
                  const PipelineOptions &options, const RunCallbacks &callbacks, RunControls &controls);

    // Same as run() on a dedicated worker thread; controls must outlive the future
    std::future<RunReport> runAsync(const std::string &input_dir, const std::string &output_dir,
                                    const std::string &trash_dir, const PipelineOptions &options,
                                    const RunCallbacks &callbacks, RunControls &controls);

    RunState getRunState() const;

private:
    MetadataResolver &resolver_;
    GeocodeCache &geocode_cache_;

    mutable std::mutex state_mutex_;
    RunState state_;

    FileOutcome processFile(const std::string &file_path, const std::string &output_dir,
                            const std::string &trash_dir, const PipelineOptions &options,
                            DuplicateRegistry &registry);

    void setState(PipelineState state, const std::string &status_message);
    void emitLog(const RunCallbacks &callbacks, bool is_error, const std::string &message);
    RunReport finish(RunReport report, PipelineState state, const RunCallbacks &callbacks);
};
