#include <data/records.hpp>
#include <data/log_accessor.hpp>
#include <core/errors.hpp>

namespace Driftwatch {

std::string to_string(EmbeddingType type) {
    switch (type) {
        case EmbeddingType::Query: return "query";
        case EmbeddingType::Doc:   return "doc";
        case EmbeddingType::All:   return "all";
    }
    return "all";
}

EmbeddingType embedding_type_from_string(const std::string& name) {
    if (name == "query") return EmbeddingType::Query;
    if (name == "doc") return EmbeddingType::Doc;
    if (name == "all") return EmbeddingType::All;
    throw ConfigurationError("Unknown embedding type '" + name + "' (expected query, doc or all)");
}

std::string to_string(LogStream stream) {
    switch (stream) {
        case LogStream::Interactions: return "interactions";
        case LogStream::Evaluations:  return "evaluations";
        case LogStream::Tasks:        return "tasks";
        case LogStream::Embeddings:   return "embeddings";
    }
    return "unknown";
}

bool was_truncated(LogAccessor& logs, LogStream stream, const TimeWindow& window,
                   const RecordQuery& query, size_t returned) {
    if (returned < query.limit) return false;
    return logs.count(stream, window, query) > returned;
}

} // namespace Driftwatch
