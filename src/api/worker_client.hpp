#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

/// Fields of GET /api/status the supervisor reads. Absent means unknown.
struct WorkerStatusInfo {
    std::optional<std::string> status;
    std::optional<std::uint64_t> memories;
    std::optional<std::uint64_t> uptime;   // seconds
    std::optional<std::string> version;
};

class WorkerClient {
public:
    explicit WorkerClient(const std::string& host, int port);
    ~WorkerClient();

    /// GET /api/status; true iff the worker answered 2xx within timeout_ms.
    /// Never throws.
    bool probe(int timeout_ms = 5000);

    /// GET /api/status and parse the body. Empty on any transport error,
    /// non-2xx status or unparsable body.
    std::optional<WorkerStatusInfo> fetch_status(int timeout_ms = 3000);

    /// Parse a status body; empty if it is not a JSON object
    static std::optional<WorkerStatusInfo> parse_status(const std::string& body);

    /// TCP connect to 127.0.0.1:port within timeout_ms
    static bool port_open(int port, int timeout_ms = 500);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
