#include "exifdate/date_session.h"

#include <algorithm>

namespace exifdate {

DirectoryReadResult
DateSession::load(std::span<const std::byte> bytes)
{
    clear();
    original_.assign(bytes);
    working_.assign(bytes);
    loaded_ = true;

    const DirectoryReadResult res = extract_date_fields(original_.bytes(),
                                                        &fields_);
    status_ = res.status;
    if (status_ != DateParseStatus::Ok) {
        fields_.clear();
    }
    return res;
}


void
DateSession::clear() noexcept
{
    original_.clear();
    working_.clear();
    fields_.clear();
    status_ = DateParseStatus::Ok;
    loaded_ = false;
}


bool
DateSession::loaded() const noexcept
{
    return loaded_;
}


DateParseStatus
DateSession::status() const noexcept
{
    return status_;
}


std::span<const DateField>
DateSession::fields() const noexcept
{
    return std::span<const DateField>(fields_.data(), fields_.size());
}


std::span<const std::byte>
DateSession::original() const noexcept
{
    return original_.bytes();
}


std::span<const std::byte>
DateSession::working() const noexcept
{
    return working_.bytes();
}


size_t
DateSession::find_field(std::string_view name) const noexcept
{
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == name) {
            return i;
        }
    }
    return fields_.size();
}


std::string
DateSession::display_value(size_t index, const NormalizeOptions& options) const
{
    if (index >= fields_.size()) {
        return std::string();
    }
    return exifdate::display_value(fields_[index], fields(), options);
}


FieldEdit
DateSession::encode_input(size_t index, std::string_view input,
                          const NormalizeOptions& options) const
{
    if (index >= fields_.size()) {
        return FieldEdit {};
    }
    return encode_edit(fields_[index], fields(), input, options);
}


std::vector<FieldEdit>
DateSession::encode_inputs(std::span<const std::string_view> inputs,
                           const NormalizeOptions& options) const
{
    std::vector<FieldEdit> edits(fields_.size());
    std::string_view gps_date;
    std::string_view gps_time;
    const size_t n = std::min(inputs.size(), fields_.size());
    for (size_t i = 0; i < n; ++i) {
        const DateField& f = fields_[i];
        if (!is_gps_utc_field(f)) {
            edits[i] = encode_edit(f, fields(), inputs[i], options);
        } else if (f.tag == tags::kGpsDateStamp) {
            gps_date = inputs[i];
        } else {
            gps_time = inputs[i];
        }
    }

    const GpsPairEdit pair = encode_gps_pair(fields(), gps_date, gps_time,
                                             options);
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (!is_gps_utc_field(fields_[i])) {
            continue;
        }
        edits[i] = (fields_[i].tag == tags::kGpsDateStamp) ? pair.date
                                                            : pair.time;
    }
    return edits;
}


PatchResult
DateSession::apply(size_t index, const FieldEdit& edit) noexcept
{
    if (index >= fields_.size()) {
        PatchResult r;
        r.status = PatchStatus::OutOfRange;
        return r;
    }
    return patch_field(working_, fields_[index], edit);
}


SaveResult
DateSession::apply_all(std::span<const FieldEdit> edits) noexcept
{
    SaveResult out;
    for (size_t i = 0; i < edits.size(); ++i) {
        const PatchResult r = apply(i, edits[i]);
        switch (r.status) {
        case PatchStatus::Written: out.written += 1; break;
        case PatchStatus::Truncated:
            out.written += 1;
            out.truncated += 1;
            break;
        case PatchStatus::Skipped: out.skipped += 1; break;
        case PatchStatus::ShapeMismatch:
        case PatchStatus::OutOfRange: out.rejected += 1; break;
        }
    }
    return out;
}


void
DateSession::revert()
{
    working_.assign(original_.bytes());
}

}  // namespace exifdate
