#include <hiecore/cradle/backend.hpp>

namespace hiecore {

Entrypoint Entrypoint::library(std::vector<std::string> exposed,
                               std::vector<std::string> other) {
    Entrypoint ep;
    ep.kind = EntrypointKind::Library;
    ep.exposed_modules = std::move(exposed);
    ep.other_modules = std::move(other);
    return ep;
}

Entrypoint Entrypoint::executable(std::string main_is,
                                  std::vector<std::string> other) {
    Entrypoint ep;
    ep.kind = EntrypointKind::Executable;
    ep.main_is = std::move(main_is);
    ep.other_modules = std::move(other);
    return ep;
}

Entrypoint Entrypoint::setup(std::string main_is) {
    Entrypoint ep;
    ep.kind = EntrypointKind::Setup;
    ep.main_is = std::move(main_is);
    return ep;
}

} // namespace hiecore
