#ifndef DOCSHIELD_SESSION_SCAN_SESSION_HPP
#define DOCSHIELD_SESSION_SCAN_SESSION_HPP

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "config/scan_config.hpp"
#include "extract/errors.hpp"
#include "extract/format_adapter.hpp"
#include "model/document_format.hpp"
#include "model/scan_result.hpp"
#include "scan/document_scanner.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

/**
 * @file scan_session.hpp
 * @brief The single "current document" state and its scan lifecycle.
 *
 * DESIGN GOALS:
 *   - State is an immutable SessionSnapshot replaced wholesale; readers hold a
 *     shared_ptr and never observe a partial update.
 *   - Every beginScan() bumps a generation counter. Extraction runs on a worker
 *     thread and reports back through one ordered completion channel; the
 *     control thread applies events in pumpCompletions() and drops any whose
 *     generation is no longer current.
 *   - The preview handle of the previous document is released before the new
 *     document is installed, in the same step that installs it.
 *
 * USAGE:
 *   @code
 *   ScanSession session(config);
 *   session.beginScan(bytes, "report.pdf", model::DocumentFormat::Pdf);
 *   session.waitForIdle();
 *   session.pumpCompletions();
 *   auto snap = session.snapshot();   // snap->state == SessionState::Done
 *   @endcode
 */

namespace docshield {
namespace session {

/**
 * @brief Stand-in for whatever renders the document for a human (a viewer
 *        window, a temp file). The session owns it and releases it exactly once.
 */
class PreviewHandle
{
public:
    virtual ~PreviewHandle() = default;
    virtual void release() = 0;
};

enum class SessionState {
    Idle,
    Scanning,
    Done,
    Failed
};

inline std::string sessionStateName(SessionState state)
{
    switch (state) {
    case SessionState::Idle:     return "idle";
    case SessionState::Scanning: return "scanning";
    case SessionState::Done:     return "done";
    case SessionState::Failed:   return "failed";
    }
    return "unknown";
}

struct SessionSnapshot
{
    uint64_t generation = 0;
    SessionState state = SessionState::Idle;
    std::string fileName;
    model::DocumentFormat format = model::DocumentFormat::Pdf;
    std::shared_ptr<const std::vector<uint8_t>> bytes;
    bool hasPreview = false;
    double progress = 0.0;
    std::shared_ptr<const model::ScanResult> result;  ///< set only when Done
    std::string error;                                ///< set only when Failed
};

class ScanSession
{
public:
    using CleanResultCallback = std::function<void(const model::ScanResult &)>;

    /**
     * @throw std::invalid_argument if the configuration cannot build a scanner.
     */
    explicit ScanSession(const config::ScanConfig &cfg)
        : scanner_(cfg),
          generation_(0),
          current_(std::make_shared<SessionSnapshot>()),
          pool_(1)
    {
    }

    ~ScanSession()
    {
        // workers finish before the channel and scanner go away
        pool_.waitIdle();
        releasePreview();
    }

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    std::shared_ptr<const SessionSnapshot> snapshot() const { return current_; }

    uint64_t generation() const { return generation_; }

    const scan::DocumentScanner &scanner() const { return scanner_; }

    /**
     * @brief Called on the control thread for every result that is safe.
     */
    void setCleanResultCallback(CleanResultCallback cb) { onClean_ = std::move(cb); }

    /**
     * @brief Install a new document and start scanning it off-thread.
     * @return The generation of the new scan.
     */
    uint64_t beginScan(std::vector<uint8_t> bytes,
                       const std::string &fileName,
                       model::DocumentFormat format,
                       std::unique_ptr<PreviewHandle> preview = nullptr)
    {
        const uint64_t gen = ++generation_;
        releasePreview();
        preview_ = std::move(preview);

        auto shared = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
        auto next = std::make_shared<SessionSnapshot>();
        next->generation = gen;
        next->state = SessionState::Scanning;
        next->fileName = fileName;
        next->format = format;
        next->bytes = shared;
        next->hasPreview = static_cast<bool>(preview_);
        current_ = next;

        util::logger::debug("ScanSession: generation " + std::to_string(gen) + " scanning " + fileName);
        pool_.enqueue([this, gen, shared, fileName, format]() { runScan(gen, shared, fileName, format); });
        return gen;
    }

    /**
     * @brief Same as above with a declared format name.
     * @throw extract::UnsupportedFormat before anything is installed.
     */
    uint64_t beginScan(std::vector<uint8_t> bytes,
                       const std::string &fileName,
                       const std::string &declaredFormat,
                       std::unique_ptr<PreviewHandle> preview = nullptr)
    {
        model::DocumentFormat format = extract::parseFormatName(declaredFormat);
        return beginScan(std::move(bytes), fileName, format, std::move(preview));
    }

    /**
     * @brief Drop the current document and supersede any scan in flight.
     */
    void reset()
    {
        const uint64_t gen = ++generation_;
        releasePreview();
        auto next = std::make_shared<SessionSnapshot>();
        next->generation = gen;
        current_ = next;
        util::logger::debug("ScanSession: reset to generation " + std::to_string(gen));
    }

    /**
     * @brief Apply queued worker events in order. Control thread only.
     * @return Number of events applied (stale ones are not counted).
     */
    size_t pumpCompletions()
    {
        std::deque<Event> events;
        {
            std::lock_guard<std::mutex> lock(channelMutex_);
            events.swap(channel_);
        }

        size_t applied = 0;
        for (auto &event : events) {
            if (event.generation != generation_) {
                util::logger::debug("ScanSession: dropping stale event of generation "
                                    + std::to_string(event.generation));
                continue;
            }
            apply(event);
            ++applied;
        }
        return applied;
    }

    /**
     * @brief Block until the worker has nothing left to do.
     */
    void waitForIdle() { pool_.waitIdle(); }

private:
    enum class EventType {
        Progress,
        Completed,
        Failed
    };

    struct Event
    {
        uint64_t generation = 0;
        EventType type = EventType::Progress;
        double progress = 0.0;
        std::shared_ptr<const model::ScanResult> result;
        std::string error;
    };

    scan::DocumentScanner scanner_;
    uint64_t generation_;
    std::shared_ptr<const SessionSnapshot> current_;
    std::unique_ptr<PreviewHandle> preview_;
    CleanResultCallback onClean_;

    std::mutex channelMutex_;
    std::deque<Event> channel_;

    util::ThreadPool pool_;  ///< last member: joined before anything it touches is destroyed

    void post(Event event)
    {
        std::lock_guard<std::mutex> lock(channelMutex_);
        channel_.push_back(std::move(event));
    }

    void runScan(uint64_t gen, const std::shared_ptr<const std::vector<uint8_t>> &bytes,
                 const std::string &fileName, model::DocumentFormat format)
    {
        Event done;
        done.generation = gen;
        try {
            model::ScanResult result = scanner_.scan(*bytes, fileName, format, [this, gen](double fraction) {
                Event progress;
                progress.generation = gen;
                progress.type = EventType::Progress;
                progress.progress = fraction;
                post(std::move(progress));
            });
            done.type = EventType::Completed;
            done.progress = 1.0;
            done.result = std::make_shared<const model::ScanResult>(std::move(result));
        }
        catch (const extract::ParseFailure &ex) {
            done.type = EventType::Failed;
            done.error = ex.what();
        }
        catch (const extract::UnsupportedFormat &ex) {
            done.type = EventType::Failed;
            done.error = ex.what();
        }
        catch (const std::exception &ex) {
            util::logger::error(std::string("ScanSession: unexpected error scanning ") + fileName + ": " + ex.what());
            done.type = EventType::Failed;
            done.error = ex.what();
        }
        post(std::move(done));
    }

    void apply(const Event &event)
    {
        auto next = std::make_shared<SessionSnapshot>(*current_);
        switch (event.type) {
        case EventType::Progress:
            next->progress = event.progress;
            break;
        case EventType::Completed:
            next->state = SessionState::Done;
            next->progress = 1.0;
            next->result = event.result;
            break;
        case EventType::Failed:
            next->state = SessionState::Failed;
            next->error = event.error;
            break;
        }
        current_ = next;

        if (event.type == EventType::Completed && event.result->safe && onClean_) {
            onClean_(*event.result);
        }
    }

    void releasePreview()
    {
        if (preview_) {
            preview_->release();
            preview_.reset();
        }
    }
};

} // namespace session
} // namespace docshield

#endif // DOCSHIELD_SESSION_SCAN_SESSION_HPP
