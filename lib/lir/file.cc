#include <lir/context.hh>
#include <lir/detail/defer.hh>
#include <lir/diags.hh>
#include <lir/file.hh>

#ifdef __linux__
#    include <fcntl.h>
#    include <sys/mman.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

lir::File::File(fs::path name, std::vector<char>&& contents)
    : _file_path(std::move(name)), _contents(std::move(contents)) {}

auto lir::File::LoadFileData(const fs::path& path) -> std::vector<char> {
#ifdef __linux__
    /// Open the file.
    int fd = open(path.c_str(), O_RDONLY);
    if (fd == -1) Diag::Fatal("Could not open file \"{}\": {}", path.string(), strerror(errno));
    defer { close(fd); };

    /// Determine the file size.
    struct stat st {};
    if (fstat(fd, &st) == -1) Diag::Fatal("Could not stat file \"{}\": {}", path.string(), strerror(errno));

    /// If the file is empty, return an empty buffer.
    if (st.st_size == 0) return {};

    /// Map the file into memory.
    void* ptr = mmap(nullptr, static_cast<usz>(st.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
    if (ptr == MAP_FAILED) Diag::Fatal("Could not map file \"{}\": {}", path.string(), strerror(errno));
    defer { munmap(ptr, static_cast<usz>(st.st_size)); };

    /// Copy the file into a vector.
    std::vector<char> ret(static_cast<usz>(st.st_size));
    std::memcpy(ret.data(), ptr, static_cast<usz>(st.st_size));
#else
    /// Read the file manually.
    std::unique_ptr<FILE, decltype(&std::fclose)> f{std::fopen(path.string().c_str(), "rb"), std::fclose};
    if (not f) Diag::Fatal("Could not open file \"{}\": {}", path.string(), strerror(errno));

    std::fseek(f.get(), 0, SEEK_END);
    auto sz = std::size_t(std::ftell(f.get()));
    std::fseek(f.get(), 0, SEEK_SET);

    std::vector<char> ret(sz);
    std::size_t n_read = 0;
    while (n_read < sz) {
        errno = 0;
        auto n = std::fread(ret.data() + n_read, 1, sz - n_read, f.get());
        if (errno) Diag::Fatal("Error reading file \"{}\": {}", path.string(), strerror(errno));
        if (n == 0) break;
        n_read += n;
    }
#endif

    return ret;
}
