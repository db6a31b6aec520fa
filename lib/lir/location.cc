#include <lir/context.hh>
#include <lir/location.hh>
#include <lir/utils.hh>

#include <algorithm>

bool lir::Location::seekable(const lir::Context* ctx) const {
    auto& files = ctx->files();
    if (file_id >= files.size()) return false;
    const auto* f = files[file_id].get();
    return is_valid() and f->size() != 0 and pos < f->size();
}

/// Seek to a source location. The location must be valid.
auto lir::Location::seek(const lir::Context* ctx) const -> LocInfo {
    LIR_ASSERT(ctx);
    LIR_ASSERT(seekable(ctx), "Cannot seek Location that is not seekable");

    LocInfo info{};
    const auto* f = ctx->files().at(file_id).get();

    // A newline belongs to the line it ends, not to the line after it:
    //
    // "foo\nbar\nEOF"
    //     ^   location points here
    //
    // collects "foo\n" as the containing line.
    const char* const data = f->data();
    info.line_start = data + pos;
    if (info.line_start > data and *info.line_start == '\n')
        --info.line_start;
    while (info.line_start > data and *info.line_start != '\n')
        --info.line_start;
    if (*info.line_start == '\n') ++info.line_start;

    // Seek forward to the end of the line.
    const char* const end = data + f->size();
    info.line_end = std::min(data + pos + len, end);
    while (info.line_end < end and *info.line_end != '\n')
        ++info.line_end;

    // Determine the line and column number.
    info.line = 1;
    for (const char* d = data; d < data + pos; ++d) {
        if (*d == '\n') {
            ++info.line;
            info.col = 0;
        } else ++info.col;
    }

    // A location on a newline reports the column of the newline, which
    // is the length of the line we collected.
    info.col = std::min<usz>(info.col, usz(info.line_end - info.line_start));
    return info;
}
