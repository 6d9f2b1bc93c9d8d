#pragma once
#include <memory>
#include <vector>

#include "svgdump/SvgDump.h"

namespace svgdump {

/**
 * Реестр обработчиков контейнеров. Обработчики перебираются по порядку
 * регистрации, первый подходящий открывает шрифт.
 */
class ContainerRegistry {
public:
    static ContainerRegistry& instance();

    void registerHandler(std::unique_ptr<ContainerHandler> handler);

    std::unique_ptr<FontTableProvider> open(const utils::ByteSpan& fontData, uint32_t faceIndex) const;
    ContainerFormat detectFormat(const utils::ByteSpan& fontData) const;
    std::vector<ContainerFormat> getSupportedFormats() const;

private:
    ContainerRegistry();
    ContainerRegistry(const ContainerRegistry&) = delete;
    ContainerRegistry& operator=(const ContainerRegistry&) = delete;

    std::vector<std::unique_ptr<ContainerHandler>> handlers;
};

} // namespace svgdump
