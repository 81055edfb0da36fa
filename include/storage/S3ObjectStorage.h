#ifndef S3_OBJECT_STORAGE_H
#define S3_OBJECT_STORAGE_H

#include "core/app_config.h"
#include "storage/ObjectStorage.h"
#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3ClientConfiguration.h>
#include <memory>

// Aws::InitAPI / Aws::ShutdownAPI for the lifetime of the process. Create
// one in main before any S3ObjectStorage.
class AwsSdkSession {
  Aws::SDKOptions options_;

public:
  AwsSdkSession() { Aws::InitAPI(options_); }
  ~AwsSdkSession() { Aws::ShutdownAPI(options_); }

  AwsSdkSession(const AwsSdkSession &) = delete;
  AwsSdkSession &operator=(const AwsSdkSession &) = delete;
};

// Multipart upload and presigned URLs against one bucket. Keys are
// "<keyPrefix><uuid>.<extension>".
class S3ObjectStorage : public IObjectStorage {
  StorageSettings settings_;
  std::string keyPrefix_;
  std::shared_ptr<Aws::S3::S3Client> s3Client_;

  void abortUpload(const std::string &key, const Aws::String &uploadId);

public:
  S3ObjectStorage(const StorageSettings &settings, std::string keyPrefix = "");

  std::string upload(ByteSource &contents,
                     const std::string &extension) override;
  std::string sign(const std::string &key,
                   const std::string &extension) override;
  void remove(const std::string &key) override;
  std::string location(const std::string &key) const override;
  StorageCredentials credentials() const override;
};

#endif
