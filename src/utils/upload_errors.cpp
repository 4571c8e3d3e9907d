module;
#include <QString>

module skylift.utils.upload_errors;

namespace skylift::utils {

QString errorDescription(UploadError error)
{
    switch (error) {
    case UploadError::None: return QString();
    case UploadError::FileNotFound: return QStringLiteral("File not found");
    case UploadError::FileReadError: return QStringLiteral("Failed to read file");
    case UploadError::InvalidChunkIndex: return QStringLiteral("Invalid chunk index");
    case UploadError::ChunkReadFailed: return QStringLiteral("Failed to read chunk");
    case UploadError::InvalidUploadTarget: return QStringLiteral("Invalid upload URL");
    case UploadError::MissingETag: return QStringLiteral("Missing ETag in upload response");
    case UploadError::MissingUploadId: return QStringLiteral("Missing upload ID for multipart upload");
    case UploadError::MissingOriginalKey: return QStringLiteral("Missing original key for multipart upload");
    case UploadError::ChunkTransferFailed: return QStringLiteral("Chunk upload failed");
    case UploadError::MultipartCompletionFailed: return QStringLiteral("Failed to complete multipart upload");
    case UploadError::SinglePartTransferFailed: return QStringLiteral("File upload failed");
    case UploadError::AssetRequestFailed: return QStringLiteral("Failed to create asset");
    case UploadError::InvalidResponse: return QStringLiteral("Invalid response from server");
    case UploadError::NoGallerySelected: return QStringLiteral("No gallery selected");
    case UploadError::Timeout: return QStringLiteral("Request timed out");
    case UploadError::Cancelled: return QStringLiteral("Upload cancelled");
    }
    return QStringLiteral("Unknown error");
}

QString errorName(UploadError error)
{
    switch (error) {
    case UploadError::None: return QStringLiteral("None");
    case UploadError::FileNotFound: return QStringLiteral("FileNotFound");
    case UploadError::FileReadError: return QStringLiteral("FileReadError");
    case UploadError::InvalidChunkIndex: return QStringLiteral("InvalidChunkIndex");
    case UploadError::ChunkReadFailed: return QStringLiteral("ChunkReadFailed");
    case UploadError::InvalidUploadTarget: return QStringLiteral("InvalidUploadTarget");
    case UploadError::MissingETag: return QStringLiteral("MissingETag");
    case UploadError::MissingUploadId: return QStringLiteral("MissingUploadId");
    case UploadError::MissingOriginalKey: return QStringLiteral("MissingOriginalKey");
    case UploadError::ChunkTransferFailed: return QStringLiteral("ChunkTransferFailed");
    case UploadError::MultipartCompletionFailed: return QStringLiteral("MultipartCompletionFailed");
    case UploadError::SinglePartTransferFailed: return QStringLiteral("SinglePartTransferFailed");
    case UploadError::AssetRequestFailed: return QStringLiteral("AssetRequestFailed");
    case UploadError::InvalidResponse: return QStringLiteral("InvalidResponse");
    case UploadError::NoGallerySelected: return QStringLiteral("NoGallerySelected");
    case UploadError::Timeout: return QStringLiteral("Timeout");
    case UploadError::Cancelled: return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}

} // namespace skylift::utils
