#pragma once

#include "s3pipe/net/http.hpp"
#include "s3pipe/storage/object_store.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace s3pipe::s3 {

// Request and response wire format of the S3 multipart API.
// Pure functions: nothing here touches the network or signs requests.

// Object URL for virtual-host or path-style addressing, AWS or custom endpoint.
// An empty key yields the bucket URL.
std::string object_url(const S3StoreConfig& config,
                       const std::string& bucket,
                       const std::string& key);

net::HttpRequest create_multipart_request(const S3StoreConfig& config,
                                          const std::string& bucket,
                                          const std::string& key);

// PUT of one part. The body borrows `data`, which must outlive the request.
net::HttpRequest upload_part_request(const S3StoreConfig& config,
                                     const SessionHandle& session,
                                     int part_number,
                                     std::span<const uint8_t> data,
                                     const std::string& content_md5);

net::HttpRequest complete_multipart_request(const S3StoreConfig& config,
                                            const SessionHandle& session,
                                            const std::vector<CompletedPart>& parts);

net::HttpRequest abort_multipart_request(const S3StoreConfig& config,
                                         const SessionHandle& session);

// CompleteMultipartUpload XML, parts in the given order with quoted ETags
std::string complete_multipart_body(const std::vector<CompletedPart>& parts);

// value = upload id
StoreResult parse_create_response(const net::HttpResponse& response);

// value = part ETag taken from the ETag header
StoreResult parse_upload_part_response(const net::HttpResponse& response);

// value = object ETag. A 200 carrying an <Error> document is a failure.
StoreResult parse_complete_response(const net::HttpResponse& response);

// value = object ETag from a HEAD response
StoreResult parse_head_response(const net::HttpResponse& response);

// Status and error fields only
StoreResult to_result(const net::HttpResponse& response);

} // namespace s3pipe::s3
