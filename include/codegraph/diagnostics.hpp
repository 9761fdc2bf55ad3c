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

#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace codegraph {

// Fails a whole command (bad target path, unwritable export path, ...)
class InvalidRequest : public std::runtime_error {
public:
    explicit InvalidRequest(const std::string &message) : std::runtime_error(message) {}
};

enum class DiagnosticKind { ParseFailure, IOFailure };

inline const char *diagnostic_kind_to_string(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::ParseFailure:
        return "parse-failure";
    case DiagnosticKind::IOFailure:
        return "io-failure";
    }
    return "unknown";
}

// Per-file problem that skipped the file without aborting the batch
struct Diagnostic {
    DiagnosticKind kind;
    std::string file;
    std::string message;
};

// Append-only, safe to share between worker threads
class DiagnosticLog {
public:
    void add(DiagnosticKind kind, const std::string &file, const std::string &message);

    // Snapshot of everything recorded so far, sorted by file
    std::vector<Diagnostic> items() const;

    size_t size() const;
    bool empty() const { return size() == 0; }

private:
    mutable std::mutex mutex_;
    std::vector<Diagnostic> items_;
};

// Result of reading a source file: text, or the reason it could not be used
struct ReadResult {
    std::optional<std::string> text;
    std::string error;
    DiagnosticKind kind = DiagnosticKind::IOFailure; // ParseFailure when not decodable

    bool ok() const { return text.has_value(); }
};

// Read a whole file and check that it decodes as UTF-8 text
ReadResult read_source_file(const std::string &path);

// True when the buffer is valid UTF-8 without NUL bytes
bool is_text(const std::string &buffer);

} // namespace codegraph
