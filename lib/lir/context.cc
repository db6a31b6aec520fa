#include <lir/context.hh>

#include <limits>
#include <utility>

auto lir::Context::get_or_load_file(fs::path path) -> File& {
    auto f = rgs::find_if(owned_files, [&](const auto& e) {
        return e->path() == path;
    });
    if (f != owned_files.end()) return **f;

    auto contents = File::LoadFileData(path);
    return make_file(std::move(path), std::move(contents));
}

auto lir::Context::make_file(fs::path name, std::vector<char>&& contents) -> File& {
    auto* fptr = new File(std::move(name), std::move(contents));
    fptr->_id = u32(owned_files.size());
    LIR_ASSERT(fptr->_id <= std::numeric_limits<u16>::max(), "Too many files in one context");
    owned_files.emplace_back(fptr);
    return *fptr;
}
