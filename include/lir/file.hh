#ifndef LIR_FILE_HH
#define LIR_FILE_HH

#include <lir/forward.hh>
#include <lir/utils.hh>

#include <filesystem>
#include <string_view>
#include <vector>

namespace lir {

/// A source file in the context.
class File {
    static constexpr u32 invalid_id{u32(-1)};

    /// The name of the file.
    fs::path _file_path;

    /// The contents of the file.
    std::vector<char> _contents;

    /// The id of the file.
    u32 _id{invalid_id};

public:
    /// We cannot move or copy files.
    File(const File&) = delete;
    File(File&&) = delete;
    auto operator=(const File&) -> File& = delete;
    auto operator=(File&&) -> File& = delete;

    /// Get the file data.
    [[nodiscard]]
    auto data() const -> const char* { return _contents.data(); }

    /// Get the id of this file.
    [[nodiscard]]
    auto file_id() const { return _id; }

    /// Get the file path.
    [[nodiscard]]
    auto path() const -> const fs::path& { return _file_path; }

    /// Get the size of the file.
    [[nodiscard]]
    auto size() const -> usz { return _contents.size(); }

    /// Get the contents as a string view.
    [[nodiscard]]
    auto text() const -> std::string_view { return {_contents.data(), _contents.size()}; }

private:
    /// Construct a file from a name and source.
    explicit File(fs::path name, std::vector<char>&& contents);

    /// Load a file from disk.
    static auto LoadFileData(const fs::path& path) -> std::vector<char>;

    /// The context is the only thing that can create files.
    friend Context;
};
} // namespace lir

#endif // LIR_FILE_HH
