// Ticket: 0008_effect_hooks

#include "shatter-sim/src/Effects/EffectRegistry.hpp"

#include <format>
#include <stdexcept>

namespace shatter_sim
{

void EffectRegistry::registerEffect(const std::string& name, EffectHook hook)
{
  if (name.empty())
  {
    throw std::invalid_argument{"Effect name must not be empty"};
  }
  if (!hook)
  {
    throw std::invalid_argument{
      std::format("Effect '{}' has no callable hook", name)};
  }
  if (!hooks_.emplace(name, std::move(hook)).second)
  {
    throw std::invalid_argument{
      std::format("Effect '{}' is already registered", name)};
  }
}

bool EffectRegistry::invoke(std::string_view name,
                            Voxel& voxel,
                            const DestroyedVoxelInfo& info) const
{
  auto it = hooks_.find(name);
  if (it == hooks_.end())
  {
    return false;
  }
  it->second(voxel, info);
  return true;
}

bool EffectRegistry::contains(std::string_view name) const
{
  return hooks_.find(name) != hooks_.end();
}

std::vector<std::string> EffectRegistry::names() const
{
  std::vector<std::string> result;
  result.reserve(hooks_.size());
  for (const auto& [name, hook] : hooks_)
  {
    result.push_back(name);
  }
  return result;
}

}  // namespace shatter_sim
