#include "storage/S3ObjectStorage.h"
#include "core/errors.h"
#include "core/logger.h"
#include "core/pipeline_config.h"
#include "utils/string_utils.h"
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>
#include <vector>

namespace {
constexpr const char *ALLOCATION_TAG = "S3ObjectStorage";

// Reads until the buffer is full or the source ends.
size_t readFully(ByteSource &source, std::vector<char> &buffer) {
  size_t filled = 0;
  while (filled < buffer.size()) {
    size_t n = source.read(buffer.data() + filled, buffer.size() - filled);
    if (n == 0)
      break;
    filled += n;
  }
  return filled;
}

std::shared_ptr<Aws::IOStream> bodyFrom(const std::vector<char> &buffer,
                                        size_t length) {
  auto body = Aws::MakeShared<Aws::StringStream>(ALLOCATION_TAG);
  body->write(buffer.data(), static_cast<std::streamsize>(length));
  return body;
}
} // namespace

S3ObjectStorage::S3ObjectStorage(const StorageSettings &settings,
                                 std::string keyPrefix)
    : settings_(settings), keyPrefix_(std::move(keyPrefix)) {
  if (settings_.bucket.empty()) {
    throw ConfigurationError("storage.bucket is not configured");
  }

  Aws::S3::S3ClientConfiguration clientConfig;
  clientConfig.region = settings_.region;
  if (!settings_.endpoint.empty()) {
    clientConfig.endpointOverride = settings_.endpoint;
    clientConfig.useVirtualAddressing = false;
  }

  if (settings_.accessKeyId.empty()) {
    s3Client_ = std::make_shared<Aws::S3::S3Client>(clientConfig);
  } else {
    Aws::Auth::AWSCredentials awsCredentials(settings_.accessKeyId,
                                             settings_.secretAccessKey);
    s3Client_ = std::make_shared<Aws::S3::S3Client>(awsCredentials, nullptr,
                                                    clientConfig);
  }
}

void S3ObjectStorage::abortUpload(const std::string &key,
                                  const Aws::String &uploadId) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(settings_.bucket);
  request.SetKey(key);
  request.SetUploadId(uploadId);
  auto outcome = s3Client_->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    Logger::error(LogCategory::STORAGE, "S3ObjectStorage::abortUpload",
                  "Failed to abort multipart upload of " + key + ": " +
                      outcome.GetError().GetMessage());
  }
}

std::string S3ObjectStorage::upload(ByteSource &contents,
                                    const std::string &extension) {
  std::string key = keyPrefix_ + StringUtils::randomUuid() + "." + extension;
  std::vector<char> part(PipelineConfig::getMultipartPartSizeBytes());

  size_t firstLength = readFully(contents, part);
  if (firstLength < part.size()) {
    // Everything fits in one part; a plain PUT avoids the multipart
    // round trips.
    Aws::S3::Model::PutObjectRequest request;
    request.SetBucket(settings_.bucket);
    request.SetKey(key);
    request.SetBody(bodyFrom(part, firstLength));
    auto outcome = s3Client_->PutObject(request);
    if (!outcome.IsSuccess()) {
      throw LoadError("Failed to upload " + key + ": " +
                      outcome.GetError().GetMessage());
    }
    Logger::info(LogCategory::STORAGE, "S3ObjectStorage::upload",
                 "Uploaded " + std::to_string(firstLength) + " bytes to " +
                     location(key));
    return key;
  }

  Aws::S3::Model::CreateMultipartUploadRequest createRequest;
  createRequest.SetBucket(settings_.bucket);
  createRequest.SetKey(key);
  auto createOutcome = s3Client_->CreateMultipartUpload(createRequest);
  if (!createOutcome.IsSuccess()) {
    throw LoadError("Failed to start multipart upload of " + key + ": " +
                    createOutcome.GetError().GetMessage());
  }
  Aws::String uploadId = createOutcome.GetResult().GetUploadId();

  try {
    Aws::S3::Model::CompletedMultipartUpload completed;
    size_t totalBytes = 0;
    size_t length = firstLength;
    int partNumber = 1;

    while (length > 0) {
      Aws::S3::Model::UploadPartRequest partRequest;
      partRequest.SetBucket(settings_.bucket);
      partRequest.SetKey(key);
      partRequest.SetUploadId(uploadId);
      partRequest.SetPartNumber(partNumber);
      partRequest.SetContentLength(static_cast<long long>(length));
      partRequest.SetBody(bodyFrom(part, length));

      auto partOutcome = s3Client_->UploadPart(partRequest);
      if (!partOutcome.IsSuccess()) {
        throw LoadError("Failed to upload part " + std::to_string(partNumber) +
                        " of " + key + ": " +
                        partOutcome.GetError().GetMessage());
      }

      Aws::S3::Model::CompletedPart completedPart;
      completedPart.SetPartNumber(partNumber);
      completedPart.SetETag(partOutcome.GetResult().GetETag());
      completed.AddParts(completedPart);

      totalBytes += length;
      ++partNumber;
      length = readFully(contents, part);
    }

    Aws::S3::Model::CompleteMultipartUploadRequest completeRequest;
    completeRequest.SetBucket(settings_.bucket);
    completeRequest.SetKey(key);
    completeRequest.SetUploadId(uploadId);
    completeRequest.SetMultipartUpload(completed);
    auto completeOutcome = s3Client_->CompleteMultipartUpload(completeRequest);
    if (!completeOutcome.IsSuccess()) {
      throw LoadError("Failed to complete multipart upload of " + key + ": " +
                      completeOutcome.GetError().GetMessage());
    }

    Logger::info(LogCategory::STORAGE, "S3ObjectStorage::upload",
                 "Uploaded " + std::to_string(totalBytes) + " bytes in " +
                     std::to_string(partNumber - 1) + " parts to " +
                     location(key));
  } catch (const std::exception &e) {
    Logger::error(LogCategory::STORAGE, "S3ObjectStorage::upload",
                  "Upload of " + key + " failed: " + std::string(e.what()));
    abortUpload(key, uploadId);
    throw;
  }
  return key;
}

std::string S3ObjectStorage::sign(const std::string &key,
                                  const std::string &extension) {
  if (!StringUtils::endsWith(key, "." + extension)) {
    throw std::invalid_argument("Key " + key + " does not carry extension ." +
                                extension);
  }
  Aws::String url = s3Client_->GeneratePresignedUrl(
      settings_.bucket, key, Aws::Http::HttpMethod::HTTP_GET,
      PipelineConfig::getPresignExpirySeconds());
  if (url.empty()) {
    throw LoadError("Failed to presign " + location(key));
  }
  return std::string(url.c_str(), url.size());
}

void S3ObjectStorage::remove(const std::string &key) {
  Aws::S3::Model::DeleteObjectRequest request;
  request.SetBucket(settings_.bucket);
  request.SetKey(key);
  auto outcome = s3Client_->DeleteObject(request);
  if (!outcome.IsSuccess()) {
    throw LoadError("Failed to delete " + location(key) + ": " +
                    outcome.GetError().GetMessage());
  }
}

std::string S3ObjectStorage::location(const std::string &key) const {
  return "s3://" + settings_.bucket + "/" + key;
}

StorageCredentials S3ObjectStorage::credentials() const {
  return {settings_.accessKeyId, settings_.secretAccessKey, settings_.region};
}
