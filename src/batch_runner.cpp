#include "batch_runner.h"
#include "workbook_loader.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

BatchRunner::BatchRunner(unsigned int threads)
    : threads_(threads) {}

BatchRunner::~BatchRunner() = default;

unsigned int BatchRunner::threadCount(size_t jobs) const {
    unsigned int wanted = threads_;
    if (wanted == 0) {
        wanted = std::max(1u, std::thread::hardware_concurrency());
    }
    return static_cast<unsigned int>(std::max<size_t>(1, std::min<size_t>(wanted, jobs)));
}

std::thread BatchRunner::startWorker(std::function<void()> work) {
    return std::thread(std::move(work));
}

void BatchRunner::workerThread(boost::lockfree::queue<size_t>& queue,
    const std::vector<ComparisonRequest>& requests,
    std::vector<JobOutcome>& outcomes) {
    ZoneScoped;
    ZoneName("Comparison Worker", 17);

#ifdef TRACY_ENABLE
    tracy::SetThreadName("Comparison Worker");
#endif

    size_t job = 0;
    while (queue.pop(job)) {
        // Each slot is written by exactly one worker
        JobOutcome& outcome = outcomes[job];
        try {
            outcome.run = std::make_unique<ComparisonRun>(runComparison(requests[job]));
            outcome.ok = true;
        }
        catch (const std::exception& e) {
            outcome.ok = false;
            outcome.error = e.what();
        }
    }
}

std::vector<BatchRunner::JobOutcome> BatchRunner::run(const std::vector<ComparisonRequest>& requests) {
    ZoneScoped;
    ZoneName("Batch Comparison", 16);

    std::vector<JobOutcome> outcomes(requests.size());
    if (requests.empty()) {
        return outcomes;
    }

    boost::lockfree::queue<size_t> queue(QUEUE_CAPACITY);
    for (size_t i = 0; i < requests.size(); ++i) {
        if (!queue.push(i)) {
            throw std::runtime_error("Could not queue comparison job " + std::to_string(i));
        }
    }

    unsigned int numWorkers = threadCount(requests.size());
    std::cout << "Using " << numWorkers << " worker threads for "
        << requests.size() << " comparisons" << std::endl;
#ifdef TRACY_ENABLE
    TracyPlot("Worker Thread Count", static_cast<int64_t>(numWorkers));
#endif

    std::vector<std::thread> workers;
    workers.reserve(numWorkers);
    try {
        for (unsigned int i = 0; i < numWorkers; ++i) {
            workers.push_back(startWorker([this, &queue, &requests, &outcomes]() {
                workerThread(queue, requests, outcomes);
                }));
        }
    }
    catch (const std::system_error& e) {
        // Workers already running drain the whole queue
        std::cerr << "Warning: started only " << workers.size() << " of "
            << numWorkers << " worker threads: " << e.what() << std::endl;
        for (auto& worker : workers) {
            worker.join();
        }
        if (workers.empty()) {
            throw;
        }
        return outcomes;
    }

    for (auto& worker : workers) {
        worker.join();
    }

    return outcomes;
}

std::vector<ComparisonRequest> BatchRunner::sharedSheetRequests(const std::string& file1,
    const std::string& file2,
    const std::vector<std::string>& keyColumns) {

    auto sheets1 = WorkbookLoader::sheetNames(file1);
    auto sheets2 = WorkbookLoader::sheetNames(file2);
    std::unordered_set<std::string> inFile2(sheets2.begin(), sheets2.end());

    std::vector<ComparisonRequest> requests;
    for (const auto& sheet : sheets1) {
        if (inFile2.count(sheet) == 0) continue;

        ComparisonRequest request;
        request.file1 = file1;
        request.file2 = file2;
        request.sheet1 = sheet;
        request.sheet2 = sheet;
        request.keyColumns = keyColumns;
        requests.push_back(std::move(request));
    }
    return requests;
}
