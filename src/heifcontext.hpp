// SPDX-License-Identifier: MIT
// HEIF context: container with image items.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "heifencoder.hpp"
#include "heifimage.hpp"
#include "heifimagehandle.hpp"
#include "heiflibrary.hpp"
#include "heifoptions.hpp"
#include "heifreader.hpp"
#include "heifwriter.hpp"

#include <libheif/heif.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

/** HEIF file context. */
class HeifContext {
public:
    /**
     * Constructor: create empty context.
     */
    HeifContext();

    HeifContext(const HeifContext&) = delete;
    HeifContext& operator=(const HeifContext&) = delete;

    /**
     * Read HEIF file.
     * @param path path to the file
     */
    void read_from_file(const std::filesystem::path& path);

    /**
     * Read HEIF data from memory, the context keeps a copy.
     * @param data HEIF data
     */
    void read_from_memory(std::vector<uint8_t> data);

    /**
     * Read HEIF data from memory without copying.
     * @param data HEIF data, must outlive the context and its handles
     */
    void read_from_memory(std::span<const uint8_t> data);

    /**
     * Read HEIF data from the stream.
     * @param stream readable and seekable stream
     */
    void read_from_stream(StreamPtr stream);

    /**
     * Read HEIF data through custom reader.
     * Data can be read only once per context.
     * @param src data reader
     */
    void read(HeifReaderPtr src);

    /**
     * Write HEIF file.
     * @param path path to the file
     */
    void write_to_file(const std::filesystem::path& path);

    /**
     * Write HEIF data to the stream.
     * @param stream writable stream
     */
    void write_to_stream(Stream& stream);

    /**
     * Write HEIF data through custom writer.
     * @param dst data writer
     */
    void write(HeifWriter& dst);

    /**
     * Get handle of the primary image.
     * @return image handle
     */
    HeifImageHandle primary_image_handle() const;

    /**
     * Get handle of the image.
     * @param id image id
     * @return image handle
     */
    HeifImageHandle image_handle(heif_item_id id) const;

    /**
     * Get ids of top level images.
     * @return list of image ids, never empty
     */
    std::vector<heif_item_id> top_level_image_ids() const;

    /**
     * Get encoder for the compression format.
     * @param format compression format
     * @return encoder instance
     */
    HeifEncoder encoder(heif_compression_format format) const;

    /**
     * Get encoder by its descriptor.
     * @param desc encoder descriptor
     * @return encoder instance
     */
    HeifEncoder encoder(const HeifEncoderDescriptor& desc) const;

    /**
     * Get list of available encoders.
     * @param format compression format, heif_compression_undefined for all
     * @param name_filter encoder id filter, nullptr for all
     * @return encoder descriptors
     */
    std::vector<HeifEncoderDescriptor>
    encoder_descriptors(heif_compression_format format =
                            heif_compression_undefined,
                        const char* name_filter = nullptr) const;

    /**
     * Encode image and add it to the context.
     * @param image image to encode
     * @param enc encoder to use
     * @param options encoding options, nullptr to use defaults
     * @return handle of the new image
     */
    HeifImageHandle encode_image(const HeifImage& image, HeifEncoder& enc,
                                 const HeifEncodingOptions* options = nullptr);

    /**
     * Encode thumbnail of the image and attach it to the master image.
     * @param image full size image
     * @param master handle of the encoded full size image
     * @param enc encoder to use
     * @param bbox_size max size of the thumbnail
     * @param options encoding options, nullptr to use defaults
     * @return thumbnail handle, nullopt if image already fits bbox_size
     */
    std::optional<HeifImageHandle>
    encode_thumbnail(const HeifImage& image, const HeifImageHandle& master,
                     HeifEncoder& enc, int bbox_size,
                     const HeifEncodingOptions* options = nullptr);

    /**
     * Set primary image.
     * @param handle image handle
     */
    void set_primary_image(const HeifImageHandle& handle);

    /**
     * Add EXIF metadata to the image.
     * @param handle image handle
     * @param data EXIF data
     */
    void add_exif_metadata(const HeifImageHandle& handle,
                           std::span<const uint8_t> data);

    /**
     * Add XMP metadata to the image.
     * @param handle image handle
     * @param data XMP data
     */
    void add_xmp_metadata(const HeifImageHandle& handle,
                          std::span<const uint8_t> data);

    /**
     * Add metadata block of any type to the image.
     * @param handle image handle
     * @param item_type item type (FourCC), e.g. "mime"
     * @param content_type MIME content type, empty if not used
     * @param data metadata
     */
    void add_generic_metadata(const HeifImageHandle& handle,
                              const std::string& item_type,
                              const std::string& content_type,
                              std::span<const uint8_t> data);

    /**
     * Get native context instance.
     * @return pointer to native context
     */
    heif_context* get() const { return context.get(); }

private:
    /**
     * Throw exception if data wasn't read yet.
     */
    void ensure_reader() const;

    /**
     * Check result of a call that can read data through the reader.
     * @param err libheif error structure
     */
    void check_read(const heif_error& err) const;

private:
    HeifReaderPtr reader; ///< Data source, released after the context
    std::unique_ptr<heif_context, decltype(&heif_context_free)> context;
};
