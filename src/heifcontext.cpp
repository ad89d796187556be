// SPDX-License-Identifier: MIT
// HEIF context: container with image items.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "heifcontext.hpp"

#include "heiferror.hpp"
#include "log.hpp"

#include <format>
#include <stdexcept>

HeifContext::HeifContext()
    : context(nullptr, &heif_context_free)
{
    HeifLibrary::check_supported();

    context.reset(heif_context_alloc());
    if (!context) {
        throw HeifError("Unable to create context",
                        heif_error_Memory_allocation_error);
    }
}

void HeifContext::read_from_file(const std::filesystem::path& path)
{
    Log::debug("Read HEIF from {}", path.string());
    read(HeifReader::from_file(path));
}

void HeifContext::read_from_memory(std::vector<uint8_t> data)
{
    read(HeifReader::from_memory(std::move(data)));
}

void HeifContext::read_from_memory(std::span<const uint8_t> data)
{
    read(HeifReader::from_memory(data));
}

void HeifContext::read_from_stream(StreamPtr stream)
{
    read(HeifReader::from_stream(std::move(stream)));
}

void HeifContext::read(HeifReaderPtr src)
{
    if (!src) {
        throw std::invalid_argument("Reader is not specified");
    }
    if (reader) {
        throw std::logic_error("The context already has a reader");
    }

    // the reader must stay alive as long as libheif can use it
    reader = std::move(src);
    check_read(heif_context_read_from_reader(
        context.get(), reader->handle(), reader->user_data(), nullptr));
}

void HeifContext::write_to_file(const std::filesystem::path& path)
{
    Log::debug("Write HEIF to {}", path.string());
    StreamWriter writer(
        std::make_unique<FileStream>(path, FileStream::Mode::Write));
    write(writer);
}

void HeifContext::write_to_stream(Stream& stream)
{
    StreamWriter writer(stream);
    write(writer);
}

void HeifContext::write(HeifWriter& dst)
{
    const heif_error err =
        heif_context_write(context.get(), dst.handle(), dst.user_data());

    // writing may load pending image data through the reader
    CallbackError* read_error = reader ? &reader->callback_error() : nullptr;
    if (dst.callback_error().has_error()) {
        if (read_error) {
            read_error->reset();
        }
        dst.callback_error().rethrow();
    }
    HeifError::check(err, read_error);
}

HeifImageHandle HeifContext::primary_image_handle() const
{
    ensure_reader();

    heif_image_handle* handle = nullptr;
    check_read(heif_context_get_primary_image_handle(context.get(), &handle));

    return HeifImageHandle(handle, reader);
}

HeifImageHandle HeifContext::image_handle(heif_item_id id) const
{
    ensure_reader();

    heif_image_handle* handle = nullptr;
    check_read(heif_context_get_image_handle(context.get(), id, &handle));

    return HeifImageHandle(handle, reader);
}

std::vector<heif_item_id> HeifContext::top_level_image_ids() const
{
    ensure_reader();

    const int count =
        heif_context_get_number_of_top_level_images(context.get());
    if (count <= 0) {
        throw HeifError("The file doesn't contain any top level images",
                        heif_error_Invalid_input);
    }

    std::vector<heif_item_id> ids(count);
    const int filled = heif_context_get_list_of_top_level_image_IDs(
        context.get(), ids.data(), count);
    if (filled != count) {
        throw HeifError("Unable to get all top level image ids",
                        heif_error_Invalid_input);
    }

    return ids;
}

HeifEncoder HeifContext::encoder(heif_compression_format format) const
{
    heif_encoder* enc = nullptr;
    HeifError::check(
        heif_context_get_encoder_for_format(context.get(), format, &enc));
    return HeifEncoder(enc);
}

HeifEncoder HeifContext::encoder(const HeifEncoderDescriptor& desc) const
{
    if (!desc.native) {
        throw std::invalid_argument("Encoder descriptor is not specified");
    }

    heif_encoder* enc = nullptr;
    HeifError::check(heif_context_get_encoder(context.get(), desc.native, &enc));
    return HeifEncoder(enc);
}

std::vector<HeifEncoderDescriptor>
HeifContext::encoder_descriptors(heif_compression_format format,
                                 const char* name_filter) const
{
    return HeifLibrary::encoder_descriptors(format, name_filter);
}

HeifImageHandle HeifContext::encode_image(const HeifImage& image,
                                          HeifEncoder& enc,
                                          const HeifEncodingOptions* options)
{
    heif_image_handle* handle = nullptr;
    heif_error err;

    if (options) {
        const auto native = options->create();
        err = heif_context_encode_image(context.get(), image.get(), enc.get(),
                                        native.get(), &handle);
    } else {
        err = heif_context_encode_image(context.get(), image.get(), enc.get(),
                                        nullptr, &handle);
    }
    HeifError::check(err);

    Log::debug("Image encoded with {}", enc.name());

    return HeifImageHandle(handle, reader);
}

std::optional<HeifImageHandle>
HeifContext::encode_thumbnail(const HeifImage& image,
                              const HeifImageHandle& master, HeifEncoder& enc,
                              int bbox_size, const HeifEncodingOptions* options)
{
    if (bbox_size <= 0) {
        throw std::out_of_range(
            std::format("Invalid thumbnail size {}", bbox_size));
    }

    heif_image_handle* handle = nullptr;
    heif_error err;

    if (options) {
        const auto native = options->create();
        err = heif_context_encode_thumbnail(context.get(), image.get(),
                                            master.get(), enc.get(),
                                            native.get(), bbox_size, &handle);
    } else {
        err = heif_context_encode_thumbnail(context.get(), image.get(),
                                            master.get(), enc.get(), nullptr,
                                            bbox_size, &handle);
    }
    HeifError::check(err);

    if (!handle) {
        Log::debug("Image fits {}px, thumbnail skipped", bbox_size);
        return std::nullopt;
    }

    return HeifImageHandle(handle, reader);
}

void HeifContext::set_primary_image(const HeifImageHandle& handle)
{
    HeifError::check(heif_context_set_primary_image(context.get(), handle.get()));
}

void HeifContext::add_exif_metadata(const HeifImageHandle& handle,
                                    std::span<const uint8_t> data)
{
    if (data.empty()) {
        throw std::invalid_argument("EXIF data is empty");
    }
    HeifError::check(heif_context_add_exif_metadata(
        context.get(), handle.get(), data.data(), static_cast<int>(data.size())));
}

void HeifContext::add_xmp_metadata(const HeifImageHandle& handle,
                                   std::span<const uint8_t> data)
{
    if (data.empty()) {
        throw std::invalid_argument("XMP data is empty");
    }
    HeifError::check(heif_context_add_XMP_metadata(
        context.get(), handle.get(), data.data(), static_cast<int>(data.size())));
}

void HeifContext::add_generic_metadata(const HeifImageHandle& handle,
                                       const std::string& item_type,
                                       const std::string& content_type,
                                       std::span<const uint8_t> data)
{
    if (item_type.empty()) {
        throw std::invalid_argument("Metadata item type is not specified");
    }
    if (data.empty()) {
        throw std::invalid_argument(
            std::format("Metadata {} is empty", item_type));
    }
    HeifError::check(heif_context_add_generic_metadata(
        context.get(), handle.get(), data.data(), static_cast<int>(data.size()),
        item_type.c_str(),
        content_type.empty() ? nullptr : content_type.c_str()));
}

void HeifContext::ensure_reader() const
{
    if (!reader) {
        throw std::logic_error(
            "HEIF data must be read before accessing images");
    }
}

void HeifContext::check_read(const heif_error& err) const
{
    HeifError::check(err, reader ? &reader->callback_error() : nullptr);
}
