#include "Builder/Resolver.hpp"

#include "Algos.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <rs/result.hpp>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace weld {

ComponentProperties mergeProperties(const ComponentProperties& base,
                                    const ComponentProperties& overrides) {
  ComponentProperties merged = base;

  const auto overrideWith = [](auto& field, const auto& value) {
    if (value.has_value()) {
      field = value;
    }
  };
  overrideWith(merged.sourceWit, overrides.sourceWit);
  overrideWith(merged.generatedWit, overrides.generatedWit);
  overrideWith(merged.componentWasm, overrides.componentWasm);
  overrideWith(merged.linkedWasm, overrides.linkedWasm);
  overrideWith(merged.componentType, overrides.componentType);
  overrideWith(merged.build, overrides.build);
  overrideWith(merged.clean, overrides.clean);
  overrideWith(merged.files, overrides.files);

  for (const auto& [name, cmds] : overrides.customCommands) {
    merged.customCommands[name] = cmds;
  }
  return merged;
}

// Follows `start` through template references.  `referrer` describes who
// names `start`, for the error message.
static rs::Result<void> checkTemplateChain(const Manifest& manifest,
                                           const std::string& start,
                                           std::string referrer) noexcept {
  std::vector<std::string> chain{ start };
  std::string current = start;
  while (true) {
    const auto itr = manifest.templates.find(current);
    rs_ensure(itr != manifest.templates.end(),
              "{} references unknown template `{}`", referrer, current);

    const auto* ref = std::get_if<TemplateRef>(&itr->second);
    if (ref == nullptr) {
      return rs::Ok();
    }
    if (std::ranges::find(chain, ref->name) != chain.end()) {
      chain.push_back(ref->name);
      rs_bail("template reference cycle: {}", fmt::join(chain, " -> "));
    }
    chain.push_back(ref->name);
    referrer = fmt::format("template `{}`", current);
    current = ref->name;
  }
}

static rs::Result<void>
checkDefaultProfile(const ComponentProfiles& profiles,
                    const std::string_view owner) noexcept {
  rs_ensure(profiles.profiles.contains(profiles.defaultProfile),
            "default profile `{}` of {} is not one of its profiles",
            profiles.defaultProfile, owner);
  return rs::Ok();
}

rs::Result<Resolver> Resolver::create(const Manifest& manifest) noexcept {
  for (const auto& [name, tmpl] : manifest.templates) {
    rs_try(checkTemplateChain(manifest, name, "manifest"));
    if (const auto* profiles = std::get_if<ComponentProfiles>(&tmpl)) {
      rs_try(checkDefaultProfile(*profiles, fmt::format("template `{}`", name)));
    }
  }

  std::unordered_set<std::string_view> seen;
  for (const ComponentDefinition& comp : manifest.components) {
    rs_ensure(seen.insert(comp.name).second, "duplicate component `{}`",
              comp.name);
    if (comp.templateName.has_value()) {
      rs_try(checkTemplateChain(manifest, *comp.templateName,
                                fmt::format("component `{}`", comp.name)));
    }
    if (const auto* profiles = std::get_if<ComponentProfiles>(&comp.body)) {
      rs_try(checkDefaultProfile(*profiles,
                                 fmt::format("component `{}`", comp.name)));
    }
  }

  for (const auto& [owner, deps] : manifest.dependencies) {
    rs_ensure(seen.contains(owner),
              "dependencies declared for unknown component `{}`", owner);
  }
  return rs::Ok(Resolver(manifest));
}

const ComponentTemplate&
Resolver::concreteTemplate(const std::string& name) const {
  const ComponentTemplate* tmpl = &manifest->templates.at(name);
  while (const auto* ref = std::get_if<TemplateRef>(tmpl)) {
    tmpl = &manifest->templates.at(ref->name);
  }
  return *tmpl;
}

rs::Result<ResolvedComponent>
Resolver::resolve(const ComponentDefinition& component,
                  const std::optional<BuildProfile>& profile) const noexcept {
  const ComponentTemplate* tmpl = nullptr;
  if (component.templateName.has_value()) {
    tmpl = &concreteTemplate(*component.templateName);
  }
  const auto* tmplProfiles =
      tmpl ? std::get_if<ComponentProfiles>(tmpl) : nullptr;
  const auto* compProfiles = std::get_if<ComponentProfiles>(&component.body);

  ResolvedComponent resolved;
  resolved.name = component.name;
  resolved.baseDir = manifest->baseDir();
  if (const auto itr = manifest->dependencies.find(component.name);
      itr != manifest->dependencies.end()) {
    resolved.dependencies = itr->second;
  }

  std::optional<std::string> selected;
  if (tmplProfiles != nullptr || compProfiles != nullptr) {
    if (profile.has_value()) {
      selected = profile->str();
    } else if (compProfiles != nullptr) {
      selected = compProfiles->defaultProfile;
    } else {
      selected = tmplProfiles->defaultProfile;
    }

    const bool found =
        (tmplProfiles != nullptr && tmplProfiles->profiles.contains(*selected))
        || (compProfiles != nullptr
            && compProfiles->profiles.contains(*selected));
    rs_ensure(found, "component `{}` has no profile `{}` (available: {})",
              component.name, *selected,
              fmt::join(profileNames(component), ", "));
  }

  // The layer a side contributes for the selected profile; null when it
  // contributes nothing.
  const auto layerOf = [&](const auto& side) -> const ComponentProperties* {
    return std::visit(
        Overloaded{
            [](const TemplateRef&) -> const ComponentProperties* {
              return nullptr;
            },
            [](const ComponentProperties& props) -> const ComponentProperties* {
              return &props;
            },
            [&](const ComponentProfiles& profiles)
                -> const ComponentProperties* {
              const auto itr = profiles.profiles.find(*selected);
              return itr == profiles.profiles.end() ? nullptr : &itr->second;
            },
        },
        side);
  };

  const ComponentProperties* tmplLayer = tmpl ? layerOf(*tmpl) : nullptr;
  const ComponentProperties* compLayer = layerOf(component.body);

  ComponentProperties base = tmplLayer ? *tmplLayer : ComponentProperties{};
  resolved.properties =
      compLayer ? mergeProperties(base, *compLayer) : std::move(base);
  resolved.profile = std::move(selected);

  spdlog::debug("Resolved component `{}` (profile: {})", resolved.name,
                resolved.profile.value_or("<none>"));
  return rs::Ok(std::move(resolved));
}

rs::Result<std::vector<ResolvedComponent>>
Resolver::resolveAll(const std::optional<BuildProfile>& profile) const noexcept {
  std::vector<ResolvedComponent> resolved;
  resolved.reserve(manifest->components.size());
  for (const ComponentDefinition& comp : manifest->components) {
    resolved.emplace_back(rs_try(resolve(comp, profile)));
  }
  return rs::Ok(std::move(resolved));
}

std::vector<std::string>
Resolver::profileNames(const ComponentDefinition& component) const {
  std::set<std::string> names;
  const auto collect = [&names](const auto& side) {
    if (const auto* profiles = std::get_if<ComponentProfiles>(&side)) {
      for (const auto& [name, props] : profiles->profiles) {
        names.insert(name);
      }
    }
  };
  if (component.templateName.has_value()) {
    collect(concreteTemplate(*component.templateName));
  }
  collect(component.body);
  return { names.begin(), names.end() };
}

} // namespace weld
