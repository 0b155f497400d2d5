// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#include <metagraph/logging/MetaGraphLogging.h>

// pystring
#include <pystring/pystring.h>

// stl
#include <atomic>
#include <iostream>
#include <mutex>
#include <vector>

namespace {

using namespace metagraph;

struct HandlerData
{
    HandlerData(MgLogHandler handler,
                void* context,
                MgLoggingSeverity severityThreshold,
                const char* module)
        : mHandler(handler)
        , mContext(context)
        , mSeverityThreshold(severityThreshold)
        , mModule(module ? module : "")
        {}

    MgLogHandler mHandler;
    void* mContext;
    MgLoggingSeverity mSeverityThreshold;
    std::string mModule;
};

struct LogEntry
{
    LogEntry(std::string module,
             std::string message,
             MgLoggingSeverity severity)
        : mModule(std::move(module))
        , mMessage(std::move(message))
        , mSeverity(severity)
        {}

    std::string mModule;
    std::string mMessage;
    MgLoggingSeverity mSeverity;
};

std::mutex sLogMutex;
std::atomic<int> sSeverity { kMgLoggingSeverityError };
std::vector<std::unique_ptr<HandlerData>> sHandlers;

void
defaultLogHandler(const char* message,
                  MgLoggingSeverity severity,
                  const char* module,
                  int indent)
{
    const char* sevString = "";
    switch (severity)
    {
    case kMgLoggingSeverityDebug:
        sevString = "DEBUG";
        break;
    case kMgLoggingSeverityInfo:
        sevString = "INFO";
        break;
    case kMgLoggingSeverityWarning:
        sevString = "WARN";
        break;
    case kMgLoggingSeverityError:
        sevString = "ERROR";
        break;
    case kMgLoggingSeverityFatal:
        sevString = "FATAL";
        break;
    default:
        break;
    }

    for (int i = 0; i < indent; ++i) {
        std::cerr << "    ";
    }
    std::cerr << module << " - " << sevString << ": " << message << "\n";
}

// caller holds sLogMutex
void
logInternal(const std::string& message,
            MgLoggingSeverity severity,
            const std::string& module,
            int indent = 0)
{
    if (sHandlers.empty()) {
        defaultLogHandler(message.c_str(), severity, module.c_str(), indent);
        return;
    }

    for (const auto& handlerData : sHandlers) {
        if (severity < handlerData->mSeverityThreshold) {
            continue;
        }
        if (!handlerData->mModule.empty() && handlerData->mModule != module) {
            continue;
        }

        handlerData->mHandler(message.c_str(),
                              severity,
                              module.c_str(),
                              indent,
                              handlerData->mContext);
    }
}

} // anonymous namespace

namespace metagraph {

struct MetaGraphLogging::ThreadLogPool::Impl
{
    std::vector<LogEntry> mEntries;
    std::string mBlockDescription;
    bool mBracket = true;
    MgLoggingSeverity mOurSeverity = kMgLoggingSeverityDebug;
    std::string mOurModule;

    void addLogEntry(LogEntry&& entry)
    {
        mEntries.emplace_back(std::move(entry));

        // the bracket lines use the worst severity seen in the block
        if (mEntries.back().mSeverity > mOurSeverity) {
            mOurSeverity = mEntries.back().mSeverity;
        }

        mOurModule = mEntries.back().mModule;
    }
};

namespace {
thread_local MetaGraphLogging::ThreadLogPool::Impl* tLogPool = nullptr;
}

MetaGraphLogging::MetaGraphLogging(const std::string& module)
    : mModule(module)
{
}

MetaGraphLogging::~MetaGraphLogging()
{
}

void
MetaGraphLogging::log(const std::string& message, MgLoggingSeverity severity) const
{
    if (tLogPool) {
        tLogPool->addLogEntry(LogEntry(mModule, message, severity));
        return;
    }

    std::lock_guard<std::mutex> lock(sLogMutex);
    logInternal(message, severity, mModule);
}

bool
MetaGraphLogging::isSeverityEnabled(MgLoggingSeverity severity) const
{
    if (severity >= sSeverity.load()) {
        return true;
    }

    // a handler registered for this module may ask for more detail
    std::lock_guard<std::mutex> lock(sLogMutex);
    for (const auto& handler : sHandlers) {
        if (handler->mModule == mModule &&
                severity >= handler->mSeverityThreshold) {
            return true;
        }
    }

    return false;
}

int
MetaGraphLogging::getSeverity()
{
    return sSeverity.load();
}

void
MetaGraphLogging::setSeverity(MgLoggingSeverity severity)
{
    sSeverity = severity;

    std::lock_guard<std::mutex> lock(sLogMutex);
    for (const auto& handler : sHandlers) {
        handler->mSeverityThreshold = severity;
    }
}

bool
MetaGraphLogging::setSeverity(const std::string& severityName)
{
    const std::string name = pystring::lower(pystring::strip(severityName));

    if (name == "debug") {
        setSeverity(kMgLoggingSeverityDebug);
    } else if (name == "info") {
        setSeverity(kMgLoggingSeverityInfo);
    } else if (name == "warning" || name == "warn") {
        setSeverity(kMgLoggingSeverityWarning);
    } else if (name == "error") {
        setSeverity(kMgLoggingSeverityError);
    } else if (name == "fatal" || name == "critical") {
        setSeverity(kMgLoggingSeverityFatal);
    } else {
        return false;
    }

    return true;
}

void*
MetaGraphLogging::registerHandler(MgLogHandler handler,
                                  void* context,
                                  MgLoggingSeverity severityThreshold,
                                  const char* module)
{
    std::lock_guard<std::mutex> lock(sLogMutex);
    sHandlers.emplace_back(new HandlerData(handler, context,
                                           severityThreshold, module));

    return sHandlers.back().get();
}

bool
MetaGraphLogging::unregisterHandler(void* handlerToken)
{
    std::lock_guard<std::mutex> lock(sLogMutex);
    for (auto it = sHandlers.begin(); it != sHandlers.end(); ++it) {
        if (it->get() == handlerToken) {
            sHandlers.erase(it);
            return true;
        }
    }

    return false;
}

//=============================================================================
// ThreadLogPool
//=============================================================================
MetaGraphLogging::ThreadLogPool::ThreadLogPool(bool bracket,
                                               const std::string& label)
    : mImpl(new Impl)
{
    mImpl->mBracket = bracket;
    mImpl->mBlockDescription = label;

    // only make us the local pool if there isn't one already
    if (!tLogPool) {
        tLogPool = mImpl.get();
    }
}

MetaGraphLogging::ThreadLogPool::~ThreadLogPool()
{
    if (tLogPool == mImpl.get()) {
        tLogPool = nullptr;
    }

    if (mImpl->mEntries.empty()) {
        return; // early out to avoid empty brackets
    }

    // hold the lock so the whole block is coherent
    std::lock_guard<std::mutex> lock(sLogMutex);

    if (mImpl->mBracket) {
        logInternal(mImpl->mBlockDescription + " --->",
                    mImpl->mOurSeverity, mImpl->mOurModule);
    }

    const int indent = mImpl->mBracket ? 1 : 0;
    for (const auto& entry : mImpl->mEntries) {
        logInternal(entry.mMessage, entry.mSeverity, entry.mModule, indent);
    }

    if (mImpl->mBracket) {
        logInternal("<---", mImpl->mOurSeverity, mImpl->mOurModule);
    }
}

} // namespace metagraph

