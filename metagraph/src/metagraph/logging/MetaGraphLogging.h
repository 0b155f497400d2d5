// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

#include <memory>
#include <sstream>
#include <string>

namespace metagraph {

enum MgLoggingSeverity
{
    kMgLoggingSeverityDebug,
    kMgLoggingSeverityInfo,
    kMgLoggingSeverityWarning,
    kMgLoggingSeverityError,
    kMgLoggingSeverityFatal,
};

/**
 * Signature of a log handler. When at least one handler is registered the
 * default stderr handler is no longer called.
 */
using MgLogHandler = void (*)(const char* message,
                              MgLoggingSeverity severity,
                              const char* module,
                              int indent,
                              void* context);

class MetaGraphLogging
{
public:
    explicit MetaGraphLogging(const std::string& module = "");
    ~MetaGraphLogging();

    void log(const std::string& message, MgLoggingSeverity severity) const;

    void debug(const std::string& message) const
    {
        log(message, kMgLoggingSeverityDebug);
    }

    void info(const std::string& message) const
    {
        log(message, kMgLoggingSeverityInfo);
    }

    void warning(const std::string& message) const
    {
        log(message, kMgLoggingSeverityWarning);
    }

    void error(const std::string& message) const
    {
        log(message, kMgLoggingSeverityError);
    }

    void critical(const std::string& message) const
    {
        log(message, kMgLoggingSeverityFatal);
    }

    bool isSeverityEnabled(MgLoggingSeverity severity) const;
    static int getSeverity();
    static void setSeverity(MgLoggingSeverity severity);

    /**
     * Accepts "debug", "info", "warning", "error" or "fatal" (any case).
     * Returns false and leaves the severity unchanged otherwise.
     */
    static bool setSeverity(const std::string& severityName);

    static void* registerHandler(MgLogHandler handler,
                                 void* context,
                                 MgLoggingSeverity severityThreshold,
                                 const char* module);

    static bool unregisterHandler(void* handlerToken);

    /**
     * Aggregates everything logged on the current thread while it is alive
     * and sends it to the handlers as one block when destroyed. If a pool is
     * already active on the thread the outer one keeps collecting.
     */
    class ThreadLogPool
    {
    public:
        ThreadLogPool(bool bracket, const std::string& label);
        ~ThreadLogPool();

        ThreadLogPool(const ThreadLogPool&) = delete;
        ThreadLogPool& operator=(const ThreadLogPool&) = delete;

    private:
        struct Impl;
        std::unique_ptr<Impl> mImpl;
    };

private:
    // no copy/assign
    MetaGraphLogging(const MetaGraphLogging& rhs);
    MetaGraphLogging& operator=(const MetaGraphLogging& rhs);

    std::string mModule;
};

} // namespace metagraph


#define MgLogSetup(name) static metagraph::MetaGraphLogging sMgLoggingClient(name);

#define MgLogInternal(logEvent, severity)                       \
    do                                                          \
    {                                                           \
        if (sMgLoggingClient.isSeverityEnabled(severity)) {     \
            std::ostringstream _log_buf;                        \
            _log_buf << logEvent;                               \
            sMgLoggingClient.log(_log_buf.str(), severity);     \
        }                                                       \
    } while (0);

// and now, wrappers for all the levels
#define MgLogFatal(logEvent) MgLogInternal(logEvent, metagraph::kMgLoggingSeverityFatal)
#define MgLogError(logEvent) MgLogInternal(logEvent, metagraph::kMgLoggingSeverityError)
#define MgLogWarn(logEvent) MgLogInternal(logEvent, metagraph::kMgLoggingSeverityWarning)
#define MgLogInfo(logEvent) MgLogInternal(logEvent, metagraph::kMgLoggingSeverityInfo)
#define MgLogDebug(logEvent) MgLogInternal(logEvent, metagraph::kMgLoggingSeverityDebug)

