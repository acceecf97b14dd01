#pragma once

#include <QString>
#include <optional>
#include <vector>

namespace dr {

// Opaque embedding model: one fixed-length vector per input string.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    // nullopt when the model could not produce a vector.
    virtual std::optional<std::vector<float>> embed(const QString& text) = 0;

    virtual int dimensions() const = 0;
};

} // namespace dr
