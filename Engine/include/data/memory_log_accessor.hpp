/**
 * @file memory_log_accessor.hpp
 * @brief Log accessor over records held in memory (tests, replayed fixtures)
 */

#pragma once

#include <data/log_accessor.hpp>
#include <mutex>

namespace Driftwatch {

/**
 * @brief In-memory LogAccessor.
 *
 * Records may be added in any order; queries apply the same window,
 * filter, ordering, limit and spread semantics as the PostgreSQL accessor.
 */
class MemoryLogAccessor : public LogAccessor {
public:
    void add(InteractionRecord record);
    void add(EvaluationRecord record);
    void add(TaskRecord record);
    void add(EmbeddingRecord record);

    /**
     * @brief Simulate a deployment without a task log table
     */
    void set_task_stream_available(bool available);

    std::vector<InteractionRecord> interactions(const TimeWindow& window, const RecordQuery& query) override;
    std::vector<EvaluationRecord> evaluations(const TimeWindow& window, const RecordQuery& query) override;
    std::optional<std::vector<TaskRecord>> tasks(const TimeWindow& window, const RecordQuery& query) override;
    std::vector<EmbeddingRecord> embeddings(const TimeWindow& window, const RecordQuery& query) override;
    size_t count(LogStream stream, const TimeWindow& window, const RecordQuery& query) override;

private:
    mutable std::mutex mutex_;
    std::vector<InteractionRecord> interactions_;
    std::vector<EvaluationRecord> evaluations_;
    std::vector<TaskRecord> tasks_;
    std::vector<EmbeddingRecord> embeddings_;
    bool task_stream_available_ = true;
};

} // namespace Driftwatch
