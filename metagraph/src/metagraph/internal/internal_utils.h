// Copyright 2025 DreamWorks Animation LLC
// SPDX-License-Identifier: Apache-2.0


#pragma once

// Linux
#include <limits.h>
#include <stdlib.h>
#include <sys/stat.h>

// C++
#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#ifndef POSIX_RET_SUCCESS
#define POSIX_RET_SUCCESS 0
#endif

namespace metagraph
{
    namespace internal
    {
        inline bool
        fileOrDirExists(const std::string& dir)
        {
            struct stat buffer;
            return (::stat(dir.c_str(), &buffer) == POSIX_RET_SUCCESS);
        }

        inline std::string
        absolutePath(const std::string& path)
        {
            char resolved_path[PATH_MAX + 1];
            const char* returned_resolved_path = ::realpath(path.c_str(), resolved_path);
            return { (returned_resolved_path != nullptr ? returned_resolved_path : "") };
        }

        /// Value of an environment variable, or the fallback when unset.
        inline std::string
        getEnv(const char* name, const std::string& fallback = std::string{})
        {
            const char* value = ::getenv(name);
            return (value != nullptr ? std::string(value) : fallback);
        }

        /// Splits a search path; empty entries are dropped.
        inline std::vector<std::string>
        splitString(const std::string& str, char delim)
        {
            std::vector<std::string> result;
            std::size_t substrStartIdx = 0;
            for (std::size_t i = 0; i <= str.size(); ++i) {
                if (i == str.size() || str[i] == delim) {
                    if (i != substrStartIdx) {
                        result.emplace_back(str, substrStartIdx, i - substrStartIdx);
                    }
                    substrStartIdx = i + 1;
                }
            }

            return result;
        }

        /**
         * Sorted absolute paths of the shared libraries directly inside dir.
         * Missing or unreadable directories yield an empty list.
         */
        inline std::vector<std::string>
        listSharedLibraries(const std::string& dir)
        {
            std::vector<std::string> result;

            std::error_code ec;
            std::filesystem::directory_iterator it(dir, ec);
            if (ec) {
                return result;
            }

            for (const auto& entry : it) {
                if (entry.path().extension() == ".so" && entry.is_regular_file(ec)) {
                    result.push_back(absolutePath(entry.path().string()));
                }
            }

            std::sort(result.begin(), result.end());
            return result;
        }
    } // namespace internal

    // concatenating paths
    inline std::string
    operator/(const std::string& lhs, const std::string& rhs)
    {
        if (!lhs.empty() && lhs.back() == '/') {
            return lhs + rhs;
        }

        return (lhs + "/" + rhs);
    }

} // namespace metagraph

