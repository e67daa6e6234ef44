// =================================================================
// src/PrintCode/Emitter.cpp
// =================================================================
// Implementation for the text and JSON emitters.

#include "PrintCode/Emitter.hpp"

namespace PrintCode {

// TextEmitter implementation

TextEmitter::TextEmitter(std::ostream& out, bool end_marker)
    : m_out(out),
      m_end_marker(end_marker),
      m_count(0)
{
}

std::string TextEmitter::headerLine(const std::string& relative_path) {
    return "========== FILE: " + relative_path + " ==========";
}

std::string TextEmitter::endLine(const std::string& relative_path) {
    return "========== END FILE: " + relative_path + " ==========";
}

void TextEmitter::emit(const EmittedRecord& record) {
    m_out << headerLine(record.relative_path) << '\n';
    m_out << record.content;

    // The next delimiter must start on its own line
    if (record.content.empty() || record.content.back() != '\n') {
        m_out << '\n';
    }

    if (m_end_marker) {
        m_out << '\n' << endLine(record.relative_path) << "\n\n";
    }

    m_out.flush();
    ++m_count;
}

void TextEmitter::finish() {
    m_out.flush();
}

// JsonEmitter implementation

JsonEmitter::JsonEmitter(std::ostream& out)
    : m_out(out),
      m_finished(false)
{
}

void JsonEmitter::emit(const EmittedRecord& record) {
    nlohmann::ordered_json entry;
    entry["path"] = record.relative_path;
    entry["file_name"] = record.file_name;
    entry["content"] = record.content;
    m_records.push_back(std::move(entry));
}

void JsonEmitter::finish() {
    if (m_finished) {
        return;
    }
    m_finished = true;

    if (m_records.empty()) {
        m_out << "[]\n";
        m_out.flush();
        return;
    }

    m_out << "[\n";
    for (size_t i = 0; i < m_records.size(); ++i) {
        if (i > 0) {
            m_out << ",\n";
        }
        // File names are not guaranteed to be UTF-8
        m_out << m_records[i].dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    }
    m_out << "\n]\n";
    m_out.flush();
}

std::unique_ptr<Emitter> createEmitter(OutputMode mode, std::ostream& out, bool end_marker) {
    if (mode == OutputMode::Json) {
        return std::make_unique<JsonEmitter>(out);
    }
    return std::make_unique<TextEmitter>(out, end_marker);
}

std::string outputModeName(OutputMode mode) {
    return mode == OutputMode::Json ? "json" : "text";
}

} // namespace PrintCode
