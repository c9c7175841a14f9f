#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace streamfetch::core {

/**
 * @brief multipart/form-data encoder whose single file part is streamed by the caller
 *
 * The body on the wire is Preamble(), then exactly file_size bytes of file content, then
 * Epilogue(). Text fields are encoded eagerly since they are small.
 */
class MultipartFormData {
public:
    MultipartFormData();
    explicit MultipartFormData(std::string boundary);

    void AddField(std::string_view name, std::string_view value);

    void SetFile(std::string_view field_name,
                 std::string_view filename,
                 std::uint64_t file_size,
                 std::string_view content_type = "application/octet-stream");

    const std::string& boundary() const { return boundary_; }

    // Value for the Content-Type header
    std::string content_type() const;

    // Every text part followed by the headers of the file part
    std::string Preamble() const;

    // Terminates the file part and closes the body
    std::string Epilogue() const;

    std::uint64_t content_length() const;

    bool has_file() const { return has_file_; }
    std::uint64_t file_size() const { return file_size_; }

    static std::string GenerateBoundary();

    // Percent-encodes '"', CR and LF for use inside a quoted header parameter
    static std::string EscapeQuoted(std::string_view value);

private:
    std::string boundary_;
    std::string fields_;
    std::string file_header_;
    std::uint64_t file_size_ = 0;
    bool has_file_ = false;
};

} // namespace streamfetch::core
