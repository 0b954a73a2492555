#pragma once

#include "comparison_run.h"
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/lockfree/queue.hpp>

// Tracy profiler integration
#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#else
#define ZoneScoped
#define ZoneScopedN(name)
#define ZoneName(name, size)
#define TracyPlot(name, value)
#define FrameMark
#define FrameMarkNamed(name)
#endif

// Runs independent comparisons on worker threads. Each job loads its own
// tables, so jobs share nothing but the work queue.
class BatchRunner {
public:
    explicit BatchRunner(unsigned int threads = 0);
    virtual ~BatchRunner();

    struct JobOutcome {
        bool ok = false;
        std::string error;
        std::unique_ptr<ComparisonRun> run;
    };

    // Outcomes are in request order. A failed job does not stop the others.
    std::vector<JobOutcome> run(const std::vector<ComparisonRequest>& requests);

    unsigned int threadCount(size_t jobs) const;

    // One request per sheet name present in both files, in file 1 order
    static std::vector<ComparisonRequest> sharedSheetRequests(const std::string& file1,
        const std::string& file2,
        const std::vector<std::string>& keyColumns);

protected:
    virtual std::thread startWorker(std::function<void()> work);

private:
    static constexpr size_t QUEUE_CAPACITY = 1024;

    void workerThread(boost::lockfree::queue<size_t>& queue,
        const std::vector<ComparisonRequest>& requests,
        std::vector<JobOutcome>& outcomes);

    unsigned int threads_;
};
