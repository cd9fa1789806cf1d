#pragma once

#include <stdexcept>
#include <string>

namespace vellum {

/**
 * @brief Base exception class for scene editing errors
 *
 * Raised only by the node editing API when the caller misuses it. The per-frame
 * update and draw generation paths never throw.
 */
class SceneException : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Exception thrown when a handle does not name a live node of the scene
 *
 * Covers destroyed nodes, handles from another scene and the null handle.
 */
class InvalidNodeException : public SceneException {
   public:
    using SceneException::SceneException;
};

/**
 * @brief Exception thrown when an attach would make a node its own ancestor
 */
class HierarchyCycleException : public SceneException {
   public:
    using SceneException::SceneException;
};

/**
 * @brief Exception thrown when a serialized frame packet cannot be decoded
 */
class FramePacketException : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

}  // namespace vellum
