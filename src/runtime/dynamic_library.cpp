#include "cdt_base.hpp"
#include "runtime/dynamic_library.hpp"

#if defined(CONDUIT_IS_POSIX)
#include <dlfcn.h>
#endif

namespace conduit::runtime
{

DynamicLibrary::~DynamicLibrary()
{
    close();
}

DynamicLibrary::DynamicLibrary(DynamicLibrary &&other) noexcept
    : m_handle(other.m_handle), m_path(std::move(other.m_path))
{
    other.m_handle = nullptr;
}

DynamicLibrary &DynamicLibrary::operator=(DynamicLibrary &&other) noexcept
{
    if (this != &other)
    {
        close();
        m_handle = other.m_handle;
        m_path = std::move(other.m_path);
        other.m_handle = nullptr;
    }
    return *this;
}

utils::Result<DynamicLibrary, std::string> DynamicLibrary::open(const std::filesystem::path &path)
{
    using R = utils::Result<DynamicLibrary, std::string>;
    DynamicLibrary lib;
#if defined(CONDUIT_PLATFORM_WIN64)
    HMODULE handle = ::LoadLibraryW(path.wstring().c_str());
    if (handle == nullptr)
    {
        const DWORD err = ::GetLastError();
        return R::error(fmt::format("LoadLibraryW('{}') failed with error {}", path.string(), err),
                        static_cast<int>(err));
    }
    lib.m_handle = reinterpret_cast<void *>(handle);
#elif defined(CONDUIT_IS_POSIX)
    ::dlerror(); // clear any stale error
    void *handle = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr)
    {
        const char *err = ::dlerror();
        return R::error(err != nullptr ? std::string(err)
                                       : fmt::format("dlopen('{}') failed", path.string()));
    }
    lib.m_handle = handle;
#else
    return R::error("dynamic loading is not supported on this platform");
#endif
    lib.m_path = path;
    return R::ok(std::move(lib));
}

void *DynamicLibrary::symbol(const char *name) const noexcept
{
    if (m_handle == nullptr || name == nullptr)
    {
        return nullptr;
    }
#if defined(CONDUIT_PLATFORM_WIN64)
    return reinterpret_cast<void *>(::GetProcAddress(static_cast<HMODULE>(m_handle), name));
#elif defined(CONDUIT_IS_POSIX)
    return ::dlsym(m_handle, name);
#else
    return nullptr;
#endif
}

void DynamicLibrary::close() noexcept
{
    if (m_handle == nullptr)
    {
        return;
    }
#if defined(CONDUIT_PLATFORM_WIN64)
    ::FreeLibrary(static_cast<HMODULE>(m_handle));
#elif defined(CONDUIT_IS_POSIX)
    if (::dlclose(m_handle) != 0)
    {
        [[maybe_unused]] const char *err = ::dlerror();
        CDT_DEBUG("DynamicLibrary: dlclose('{}') failed: {}", m_path.string(),
                  err != nullptr ? err : "unknown error");
    }
#endif
    m_handle = nullptr;
}

} // namespace conduit::runtime
