#pragma once
#include "catalog/CatalogNode.hpp"
#include <stdexcept>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

enum class FetchKind {
    Children,
    Art,
    Lyrics
};

inline std::string fetchKindToString(FetchKind k) {
    switch (k) {
        case FetchKind::Children: return "children";
        case FetchKind::Art:      return "art";
        case FetchKind::Lyrics:   return "lyrics";
    }
    return "unknown";
}

// One unit of background work. Identity is the (targetId, kind) pair.
struct FetchRequest {
    NodeId    targetId;
    FetchKind kind = FetchKind::Children;

    bool operator==(const FetchRequest& o) const {
        return targetId == o.targetId && kind == o.kind;
    }
    bool operator!=(const FetchRequest& o) const { return !(*this == o); }
    bool operator<(const FetchRequest& o) const {
        return std::tie(targetId, kind) < std::tie(o.targetId, o.kind);
    }

    std::string describe() const {
        return fetchKindToString(kind) + "(" +
               (targetId.empty() ? std::string("<root>") : targetId) + ")";
    }
};

// Backend failure taxonomy. Every kind is recovered locally.
class FetchError : public std::runtime_error {
public:
    enum class Kind {
        Network,    // transport failure or timeout
        NotFound,
        Malformed,  // response could not be parsed
        Server      // HTTP error status or API-level failure
    };

    FetchError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

    static std::string kindToString(Kind k) {
        switch (k) {
            case Kind::Network:   return "network";
            case Kind::NotFound:  return "not found";
            case Kind::Malformed: return "malformed response";
            case Kind::Server:    return "server error";
        }
        return "unknown";
    }

private:
    Kind kind_;
};

struct ArtPayload {
    std::string bytes;
    std::string mimeType;
};

struct LyricsPayload {
    std::string text;   // empty when the server has no lyrics
};

struct FetchFailure {
    std::string reason;
};

using FetchResult = std::variant<std::vector<CatalogNode>,
                                 ArtPayload,
                                 LyricsPayload,
                                 FetchFailure>;

inline bool fetchSucceeded(const FetchResult& r) {
    return !std::holds_alternative<FetchFailure>(r);
}

// What the scheduler yields when a request finishes
struct FetchCompletion {
    FetchRequest request;
    FetchResult  result;
};
