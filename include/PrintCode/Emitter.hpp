// =================================================================
// include/PrintCode/Emitter.hpp
// =================================================================
// Header for rendering accepted files as delimited text or JSON.

#pragma once

#include "nlohmann/json.hpp"
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace PrintCode {

/**
 * @brief Output rendering mode, chosen once per run
 */
enum class OutputMode {
    Text,   ///< Streamed, delimited blocks
    Json    ///< Buffered JSON array written at the end
};

/**
 * @brief One accepted file ready for output
 */
struct EmittedRecord {
    std::string relative_path;  ///< Root-relative, '/' separated
    std::string file_name;      ///< Final path component
    std::string content;        ///< Possibly sanitized content
};

/**
 * @brief Writes records to the output stream
 */
class Emitter {
public:
    virtual ~Emitter() = default;

    /**
     * @brief Render or buffer one record
     */
    virtual void emit(const EmittedRecord& record) = 0;

    /**
     * @brief Complete the output once every root has been scanned
     */
    virtual void finish() = 0;

    virtual size_t recordCount() const = 0;
};

/**
 * @brief Delimited text blocks, flushed per record
 *
 * Peak memory stays bounded by a single file's content.
 */
class TextEmitter : public Emitter {
public:
    TextEmitter(std::ostream& out, bool end_marker);

    void emit(const EmittedRecord& record) override;
    void finish() override;
    size_t recordCount() const override { return m_count; }

    static std::string headerLine(const std::string& relative_path);
    static std::string endLine(const std::string& relative_path);

private:
    std::ostream& m_out;
    bool m_end_marker;
    size_t m_count;
};

/**
 * @brief JSON array of {path, file_name, content} objects
 *
 * Every record is held in memory until finish() writes the array, since
 * the closing bracket can only follow the last root.
 */
class JsonEmitter : public Emitter {
public:
    explicit JsonEmitter(std::ostream& out);

    void emit(const EmittedRecord& record) override;
    void finish() override;
    size_t recordCount() const override { return m_records.size(); }

private:
    std::ostream& m_out;
    std::vector<nlohmann::ordered_json> m_records;
    bool m_finished;
};

/**
 * @brief Build the emitter for the configured mode
 */
std::unique_ptr<Emitter> createEmitter(OutputMode mode, std::ostream& out, bool end_marker);

std::string outputModeName(OutputMode mode);

} // namespace PrintCode
