#pragma once

#include "filesystem.hpp"
#include "session.hpp"

#include <filesystem>
#include <string>

namespace patchwise {

// `requested` empty selects context.txt; names without .txt get it appended.
std::string transcript_filename(const std::string& requested);

std::string render_transcript(const Session& session, const std::string& exported_at);

// Writes the transcript and returns the number of messages exported.
// Throws std::runtime_error when the session has no history or the write fails.
std::size_t export_transcript(FileSystem& files, const Session& session, const std::filesystem::path& target);

} // namespace patchwise
