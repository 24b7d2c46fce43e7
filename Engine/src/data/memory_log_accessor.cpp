/**
 * @file memory_log_accessor.cpp
 * @brief In-memory log accessor implementation
 */

#include <data/memory_log_accessor.hpp>
#include <algorithm>

namespace Driftwatch {

namespace {

template <typename Record, typename Predicate>
std::vector<Record> matching(const std::vector<Record>& source, const TimeWindow& window, Predicate keep) {
    std::vector<Record> out;
    for (const auto& r : source) {
        if (window.contains(r.timestamp) && keep(r)) out.push_back(r);
    }
    return out;
}

// Keeps the first row of each of `limit` equal-width buckets over the
// oldest-first index range, so exactly `limit` rows survive
template <typename Record>
std::vector<Record> spread_sample(const std::vector<Record>& sorted, size_t limit) {
    const size_t n = sorted.size();
    std::vector<Record> out;
    out.reserve(limit);
    for (size_t j = 0; j < n; ++j) {
        if (j == 0 || (j * limit) / n != ((j - 1) * limit) / n) out.push_back(sorted[j]);
    }
    return out;
}

template <typename Record, typename Predicate>
std::vector<Record> select(const std::vector<Record>& source, const TimeWindow& window,
                           const RecordQuery& query, Predicate keep) {
    std::vector<Record> out = matching(source, window, keep);

    if (query.spread && out.size() > query.limit && query.limit > 0) {
        std::stable_sort(out.begin(), out.end(),
            [](const Record& a, const Record& b) { return a.timestamp < b.timestamp; });
        out = spread_sample(out, query.limit);
        if (query.order == RecordOrder::NewestFirst) std::reverse(out.begin(), out.end());
        return out;
    }

    if (query.order == RecordOrder::OldestFirst) {
        std::stable_sort(out.begin(), out.end(),
            [](const Record& a, const Record& b) { return a.timestamp < b.timestamp; });
    } else {
        std::stable_sort(out.begin(), out.end(),
            [](const Record& a, const Record& b) { return a.timestamp > b.timestamp; });
    }

    if (out.size() > query.limit) out.resize(query.limit);
    return out;
}

auto interaction_filter(const RecordQuery& query) {
    return [refusals_only = query.refusals_only](const InteractionRecord& r) {
        return !refusals_only || r.refusal_flag;
    };
}

auto embedding_filter(const RecordQuery& query) {
    return [type = query.embedding_type](const EmbeddingRecord& r) {
        return type == EmbeddingType::All || r.type == type;
    };
}

} // namespace

void MemoryLogAccessor::add(InteractionRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    interactions_.push_back(std::move(record));
}

void MemoryLogAccessor::add(EvaluationRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    evaluations_.push_back(std::move(record));
}

void MemoryLogAccessor::add(TaskRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(record);
}

void MemoryLogAccessor::add(EmbeddingRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    embeddings_.push_back(std::move(record));
}

void MemoryLogAccessor::set_task_stream_available(bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    task_stream_available_ = available;
}

std::vector<InteractionRecord> MemoryLogAccessor::interactions(const TimeWindow& window, const RecordQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    return select(interactions_, window, query, interaction_filter(query));
}

std::vector<EvaluationRecord> MemoryLogAccessor::evaluations(const TimeWindow& window, const RecordQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    return select(evaluations_, window, query, [](const EvaluationRecord&) { return true; });
}

std::optional<std::vector<TaskRecord>> MemoryLogAccessor::tasks(const TimeWindow& window, const RecordQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!task_stream_available_) return std::nullopt;
    return select(tasks_, window, query, [](const TaskRecord&) { return true; });
}

std::vector<EmbeddingRecord> MemoryLogAccessor::embeddings(const TimeWindow& window, const RecordQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    return select(embeddings_, window, query, embedding_filter(query));
}

size_t MemoryLogAccessor::count(LogStream stream, const TimeWindow& window, const RecordQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto any = [](const auto&) { return true; };
    switch (stream) {
        case LogStream::Interactions: return matching(interactions_, window, interaction_filter(query)).size();
        case LogStream::Evaluations:  return matching(evaluations_, window, any).size();
        case LogStream::Tasks:        return task_stream_available_ ? matching(tasks_, window, any).size() : 0;
        case LogStream::Embeddings:   return matching(embeddings_, window, embedding_filter(query)).size();
    }
    return 0;
}

} // namespace Driftwatch
