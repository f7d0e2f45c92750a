#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace jbind
{

  // Shared marker for "JSON null was present", one per value shape
  class NullSentinel final
  {
  public:
    // Only the registry can make one
    class Key final
    {
      friend class NullRegistry;
      Key() = default;
    };

    NullSentinel(Key, std::string shape)
      : m_shape(std::move(shape))
      , m_owner(this, [](const void*) {})
    {}

    NullSentinel(const NullSentinel&) = delete;
    NullSentinel& operator=(const NullSentinel&) = delete;

    const std::string& shape() const noexcept { return m_shape; }

    // Control block shared by empty pointers that were bound from null
    const std::shared_ptr<const void>& owner() const noexcept { return m_owner; }

    bool owns(const std::shared_ptr<const void>& pointer) const noexcept
    {
      return !pointer.owner_before(m_owner) && !m_owner.owner_before(pointer);
    }

  private:
    std::string m_shape;
    std::shared_ptr<const void> m_owner;
  };

  //---------------------------------------------------------------------------------------------------------------------
  class NullRegistry final
  {
  public:
    static NullRegistry& Instance()
    {
      static NullRegistry registry;
      return registry;
    }

    const NullSentinel& sentinelFor(std::string_view shape)
    {
      {
        std::shared_lock lock(m_mutex);
        if (auto iter = m_sentinels.find(std::string(shape)); iter != m_sentinels.end())
          return *iter->second;
      }

      std::unique_lock lock(m_mutex);
      auto& slot = m_sentinels[std::string(shape)];
      if (!slot)
        slot = std::make_unique<NullSentinel>(NullSentinel::Key(), std::string(shape));

      return *slot;
    }

    bool isSentinel(const NullSentinel* candidate) const
    {
      if (!candidate)
        return false;

      std::shared_lock lock(m_mutex);
      auto iter = m_sentinels.find(candidate->shape());
      return iter != m_sentinels.end() && iter->second.get() == candidate;
    }

  private:
    NullRegistry() = default;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::unique_ptr<NullSentinel>> m_sentinels;
  };

  //---------------------------------------------------------------------------------------------------------------------
  inline const NullSentinel& SentinelFor(std::string_view shape)
  {
    return NullRegistry::Instance().sentinelFor(shape);
  }

  //---------------------------------------------------------------------------------------------------------------------
  inline bool IsSentinel(const NullSentinel* candidate)
  {
    return NullRegistry::Instance().isSentinel(candidate);
  }

  //---------------------------------------------------------------------------------------------------------------------
  // Marker for untyped (open) nulls
  inline const NullSentinel& OpenNull()
  {
    static const NullSentinel& sentinel = SentinelFor("open");
    return sentinel;
  }

} // namespace jbind
