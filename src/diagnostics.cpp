// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "codegraph/diagnostics.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace codegraph {

void DiagnosticLog::add(DiagnosticKind kind, const std::string &file, const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.push_back({kind, file, message});
}

std::vector<Diagnostic> DiagnosticLog::items() const {
    std::vector<Diagnostic> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = items_;
    }
    // Workers append in no particular order
    std::stable_sort(copy.begin(), copy.end(),
                     [](const Diagnostic &a, const Diagnostic &b) { return a.file < b.file; });
    return copy;
}

size_t DiagnosticLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

bool is_text(const std::string &buffer) {
    size_t i = 0;
    const size_t n = buffer.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(buffer[i]);
        if (c == 0)
            return false;
        size_t extra = 0;
        if (c < 0x80)
            extra = 0;
        else if ((c & 0xE0) == 0xC0)
            extra = 1;
        else if ((c & 0xF0) == 0xE0)
            extra = 2;
        else if ((c & 0xF8) == 0xF0)
            extra = 3;
        else
            return false;
        if (i + extra >= n && extra > 0)
            return false;
        for (size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<unsigned char>(buffer[i + k]);
            if ((cc & 0xC0) != 0x80)
                return false;
        }
        i += extra + 1;
    }
    return true;
}

ReadResult read_source_file(const std::string &path) {
    ReadResult result;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        result.error = "cannot open file: " + std::string(std::strerror(errno));
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        result.error = "read error";
        return result;
    }

    std::string content = buffer.str();
    if (!is_text(content)) {
        result.error = "file is not valid UTF-8 text";
        result.kind = DiagnosticKind::ParseFailure;
        return result;
    }
    result.text = std::move(content);
    return result;
}

} // namespace codegraph
