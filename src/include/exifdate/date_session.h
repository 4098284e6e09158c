#pragma once

#include "exifdate/byte_arena.h"
#include "exifdate/date_field.h"
#include "exifdate/field_patch.h"
#include "exifdate/tiff_dir_read.h"
#include "exifdate/tz_normalize.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file date_session.h
 * \brief One loaded image: original bytes, working copy and extracted fields.
 */

namespace exifdate {

/// Totals for one \ref DateSession::apply_all batch.
struct SaveResult final {
    uint32_t written   = 0;
    uint32_t truncated = 0;
    uint32_t skipped   = 0;
    /// Edits refused with ShapeMismatch or OutOfRange.
    uint32_t rejected = 0;
};

/**
 * \brief Editing session for a single JPEG buffer.
 *
 * \ref load copies the input into an immutable original and a working copy of
 * the same size and extracts the field list once. Patches only touch the
 * working copy, at the offsets recorded during extraction. A failed
 * extraction leaves an empty field list; the buffers stay loaded so the
 * output equals the input.
 */
class DateSession final {
public:
    DateSession() = default;

    /// Replaces any previous state with \p bytes and extracts its fields.
    DirectoryReadResult load(std::span<const std::byte> bytes);
    /// Discards both buffers and the field list.
    void clear() noexcept;

    bool loaded() const noexcept;
    DateParseStatus status() const noexcept;

    std::span<const DateField> fields() const noexcept;
    std::span<const std::byte> original() const noexcept;
    /// The edited bytes; identical to \ref original outside edited fields.
    std::span<const std::byte> working() const noexcept;

    /// Returns the index of the field named \p name, or `fields().size()`.
    size_t find_field(std::string_view name) const noexcept;

    /// Editor string for field \p index (empty if out of range).
    std::string display_value(size_t index,
                              const NormalizeOptions& options) const;
    /// Converts editor input for field \p index into a patchable value.
    FieldEdit encode_input(size_t index, std::string_view input,
                           const NormalizeOptions& options) const;
    /**
     * \brief Converts one editor input per field (empty = unchanged).
     *
     * GPS date and time inputs are paired into a single local instant and
     * converted back to UTC together; when either is edited both GPS fields
     * get a value.
     */
    std::vector<FieldEdit>
    encode_inputs(std::span<const std::string_view> inputs,
                  const NormalizeOptions& options) const;

    /// Patches field \p index of the working copy.
    PatchResult apply(size_t index, const FieldEdit& edit) noexcept;
    /// Patches fields `0..edits.size()-1` in order.
    SaveResult apply_all(std::span<const FieldEdit> edits) noexcept;
    /// Restores the working copy to the original bytes.
    void revert();

private:
    FixedByteArena original_;
    FixedByteArena working_;
    std::vector<DateField> fields_;
    DateParseStatus status_ = DateParseStatus::Ok;
    bool loaded_            = false;
};

}  // namespace exifdate
