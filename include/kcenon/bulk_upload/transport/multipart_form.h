/**
 * @file multipart_form.h
 * @brief multipart/form-data body builder
 */

#ifndef KCENON_BULK_UPLOAD_TRANSPORT_MULTIPART_FORM_H
#define KCENON_BULK_UPLOAD_TRANSPORT_MULTIPART_FORM_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../core/upload_types.h"

namespace kcenon::bulk_upload {

/// Field name carrying the file bytes in every upload form
inline constexpr const char* file_field_name = "file";

/**
 * @brief The binary part of a form
 */
struct multipart_file_part {
    std::string field_name = file_field_name;
    std::string filename;
    std::string content_type = "application/octet-stream";
    std::vector<uint8_t> data;
};

/**
 * @brief A multipart/form-data body with text fields followed by one file
 *
 * Fields are written in insertion order; the file part is always written
 * last, after every text field, as object stores require.
 *
 * @code
 * multipart_form form;
 * for (const auto& [key, value] : destination.form_fields) {
 *     form.add_field(key, value);
 * }
 * form.set_file("photo.jpg", "image/jpeg", std::move(bytes));
 * request.headers["Content-Type"] = form.content_type();
 * request.body = form.encode();
 * @endcode
 */
class multipart_form {
public:
    /**
     * @brief Create a form with a random boundary
     */
    multipart_form();

    /**
     * @brief Create a form with a given boundary (used when rebuilding a request)
     */
    explicit multipart_form(std::string boundary);

    void add_field(std::string name, std::string value);

    void set_file(std::string filename,
                  std::string content_type,
                  std::vector<uint8_t> data,
                  std::string field_name = file_field_name);

    void set_file(multipart_file_part part);

    [[nodiscard]] auto boundary() const -> const std::string& { return boundary_; }
    [[nodiscard]] auto fields() const -> const form_field_list& { return fields_; }
    [[nodiscard]] auto file() const -> const std::optional<multipart_file_part>& { return file_; }

    /**
     * @brief Value for the Content-Type request header
     */
    [[nodiscard]] auto content_type() const -> std::string;

    /**
     * @brief Serialize the body
     */
    [[nodiscard]] auto encode() const -> std::vector<uint8_t>;

    /**
     * @brief Generate a boundary unlikely to occur in the payload
     */
    [[nodiscard]] static auto generate_boundary() -> std::string;

private:
    std::string boundary_;
    form_field_list fields_;
    std::optional<multipart_file_part> file_;
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_TRANSPORT_MULTIPART_FORM_H
