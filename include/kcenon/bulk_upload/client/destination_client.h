/**
 * @file destination_client.h
 * @brief Bulk signed-destination issuance
 */

#ifndef KCENON_BULK_UPLOAD_CLIENT_DESTINATION_CLIENT_H
#define KCENON_BULK_UPLOAD_CLIENT_DESTINATION_CLIENT_H

#include <memory>
#include <span>
#include <string>
#include <vector>

#include "../core/types.h"
#include "../core/upload_types.h"
#include "../transport/http_transport.h"

namespace kcenon::bulk_upload {

/**
 * @brief Requests one signed destination per file in a single call
 *
 * The returned list is index-aligned with the input. It may be shorter
 * than the input when the coordinator issued only part of the batch;
 * callers must treat the missing tail as unmapped.
 */
class destination_client_interface {
public:
    virtual ~destination_client_interface() = default;

    virtual auto request_destinations(std::span<const file_descriptor> files,
                                      const std::string& credential)
        -> result<std::vector<signed_destination>> = 0;
};

/**
 * @brief JSON encoding of the bulk destination exchange
 *
 * Request:
 * @code
 * {"files":[{"filename":"a.jpg","fileType":"image/jpeg","fileSize":1024,
 *            "relativePath":"album/a.jpg"}]}
 * @endcode
 * Response:
 * @code
 * {"presigned_urls":[{"url":"https://...","fields":{"key":"..."},
 *                     "media_file_id":42,"s3_key":"uploads/a.jpg"}]}
 * @endcode
 */
namespace destination_wire {

[[nodiscard]] auto encode_request(std::span<const file_descriptor> files) -> std::string;

/**
 * @brief Decode a response body
 *
 * Form field order is preserved as received. Numeric ids are rendered as
 * decimal strings.
 */
[[nodiscard]] auto decode_response(const std::string& body)
    -> result<std::vector<signed_destination>>;

}  // namespace destination_wire

/**
 * @brief Destination client calling `{api_base}/media-files/get_presigned_urls/`
 *
 * A non-2xx status or a transport failure fails the whole batch with
 * destination_issuance_failed; this layer never retries.
 */
class http_destination_client : public destination_client_interface {
public:
    http_destination_client(std::string api_base,
                            std::shared_ptr<http_transport_interface> transport);

    auto request_destinations(std::span<const file_descriptor> files,
                              const std::string& credential)
        -> result<std::vector<signed_destination>> override;

    [[nodiscard]] auto endpoint() const -> const std::string& { return endpoint_; }

    [[nodiscard]] static auto endpoint_for(const std::string& api_base) -> std::string;

private:
    std::string endpoint_;
    std::shared_ptr<http_transport_interface> transport_;
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_CLIENT_DESTINATION_CLIENT_H
