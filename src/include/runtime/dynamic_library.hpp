#pragma once
/**
 * @file dynamic_library.hpp
 * @brief RAII handle to a shared library opened with the platform loader.
 *
 * POSIX uses `dlopen(RTLD_NOW | RTLD_LOCAL)` so symbols of one component's library never
 * satisfy lookups from another component's library. Windows uses `LoadLibraryW`.
 */
#include "conduit_runtime_export.h"
#include "utils/result.hpp"

#include <filesystem>
#include <string>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace conduit::runtime
{

class CONDUIT_RUNTIME_EXPORT DynamicLibrary
{
  public:
    DynamicLibrary() noexcept = default;
    ~DynamicLibrary();

    DynamicLibrary(DynamicLibrary &&other) noexcept;
    DynamicLibrary &operator=(DynamicLibrary &&other) noexcept;
    DynamicLibrary(const DynamicLibrary &) = delete;
    DynamicLibrary &operator=(const DynamicLibrary &) = delete;

    /**
     * @brief Opens @p path.
     * @details A path without a directory component is searched on the loader's default
     *          search path. On failure the error is the platform loader's message.
     */
    [[nodiscard]] static utils::Result<DynamicLibrary, std::string>
    open(const std::filesystem::path &path);

    /// Address of @p name, or nullptr if the library does not export it.
    void *symbol(const char *name) const noexcept;

    template <typename T> T symbol_as(const char *name) const noexcept
    {
        return reinterpret_cast<T>(symbol(name));
    }

    bool is_open() const noexcept { return m_handle != nullptr; }
    const std::filesystem::path &path() const noexcept { return m_path; }

    /// Unloads the library. Safe to call more than once.
    void close() noexcept;

  private:
    void *m_handle{nullptr};
    std::filesystem::path m_path;
};

} // namespace conduit::runtime

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
