#include "core/pipeline_config.h"

std::atomic<size_t> PipelineConfig::FETCH_BATCH_SIZE{
    PipelineConfig::DEFAULT_FETCH_BATCH_SIZE};
std::atomic<int> PipelineConfig::COMPRESSION_LEVEL{
    PipelineConfig::DEFAULT_COMPRESSION_LEVEL};
std::atomic<size_t> PipelineConfig::MULTIPART_PART_SIZE_MB{
    PipelineConfig::DEFAULT_MULTIPART_PART_SIZE_MB};
std::atomic<size_t> PipelineConfig::PRESIGN_EXPIRY_SECONDS{
    PipelineConfig::DEFAULT_PRESIGN_EXPIRY_SECONDS};
std::atomic<size_t> PipelineConfig::MAX_WORKERS{
    PipelineConfig::DEFAULT_MAX_WORKERS};
