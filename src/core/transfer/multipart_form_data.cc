#include <algorithm>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/transfer/multipart_form_data.h>

namespace streamfetch::core {

MultipartFormData::MultipartFormData()
    : MultipartFormData(GenerateBoundary()) {}

MultipartFormData::MultipartFormData(std::string boundary)
    : boundary_(std::move(boundary)) {}

std::string MultipartFormData::GenerateBoundary() {
    boost::uuids::random_generator uuid_gen;
    std::string id = boost::uuids::to_string(uuid_gen());
    id.erase(std::remove(id.begin(), id.end(), '-'), id.end());
    return "----StreamFetchBoundary" + id;
}

std::string MultipartFormData::EscapeQuoted(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
        case '"':
            escaped += "%22";
            break;
        case '\r':
            escaped += "%0D";
            break;
        case '\n':
            escaped += "%0A";
            break;
        default:
            escaped += c;
        }
    }
    return escaped;
}

void MultipartFormData::AddField(std::string_view name, std::string_view value) {
    fields_ += "--" + boundary_ + "\r\n";
    fields_ += "Content-Type: text/plain; charset=utf-8\r\n";
    fields_ += "Content-Disposition: form-data; name=\"" + EscapeQuoted(name) + "\"\r\n";
    fields_ += "\r\n";
    fields_ += value;
    fields_ += "\r\n";
}

void MultipartFormData::SetFile(std::string_view field_name,
                                std::string_view filename,
                                std::uint64_t file_size,
                                std::string_view content_type) {
    file_header_ = "--" + boundary_ + "\r\n";
    file_header_ += "Content-Type: " + std::string(content_type) + "\r\n";
    file_header_ += "Content-Disposition: form-data; name=\"" + EscapeQuoted(field_name)
                    + "\"; filename=\"" + EscapeQuoted(filename) + "\"\r\n";
    file_header_ += "\r\n";
    file_size_ = file_size;
    has_file_ = true;
}

std::string MultipartFormData::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::string MultipartFormData::Preamble() const {
    return fields_ + file_header_;
}

std::string MultipartFormData::Epilogue() const {
    std::string closing = "--" + boundary_ + "--\r\n";
    return has_file_ ? "\r\n" + closing : closing;
}

std::uint64_t MultipartFormData::content_length() const {
    return fields_.size() + file_header_.size() + file_size_ + Epilogue().size();
}

} // namespace streamfetch::core
