/*!
 * @file        upload_errors.cppm
 * @brief       Error taxonomy shared by the transfer pipeline.
 * @details     Every component of the pipeline reports failures with a value
 *              of UploadError next to a boolean or empty result, and
 *              asynchronous operations expose the last error through an
 *              error() accessor once they signal completion.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module skylift.utils.upload_errors;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

/**
 * @brief Failure kinds produced by readers, transports and transfers.
 */
SKYLIFT_MODULE_EXPORT enum class UploadError {
    None,                       //!< No error
    FileNotFound,               //!< Source file does not exist
    FileReadError,              //!< Source file exists but cannot be opened
    InvalidChunkIndex,          //!< Requested chunk lies past the end of the file
    ChunkReadFailed,            //!< Seek or read of a chunk range failed
    InvalidUploadTarget,        //!< Missing or malformed presigned URL
    MissingETag,                //!< Part upload succeeded without an ETag header
    MissingUploadId,            //!< Multipart response carried no upload id
    MissingOriginalKey,         //!< Multipart response carried no object key
    ChunkTransferFailed,        //!< Part PUT failed after all retries
    MultipartCompletionFailed,  //!< Finalize call returned a non-2xx status
    SinglePartTransferFailed,   //!< Form POST of a small file failed
    AssetRequestFailed,         //!< Asset creation call failed
    InvalidResponse,            //!< Response body could not be parsed
    NoGallerySelected,          //!< No destination gallery configured
    Timeout,                    //!< Request exceeded the transfer timeout
    Cancelled                   //!< Operation was cancelled by the caller
};

SKYLIFT_MODULE_EXPORT namespace skylift::utils {

/**
 * @brief Returns a human readable description for an error value.
 * @param error Error to describe.
 * @return Short sentence suitable for status text and notices.
 */
QString errorDescription(UploadError error);

/**
 * @brief Returns the enumerator name, e.g. "ChunkTransferFailed".
 */
QString errorName(UploadError error);

} // namespace skylift::utils
