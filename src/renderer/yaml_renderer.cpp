// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <ostream>
#include <span>
#include <string>

#include <yaml-cpp/emitter.h>
#include <yaml-cpp/emittermanip.h>
#include <yaml-cpp/yaml.h>

#include "fraud_flags.hpp"
#include "identifier_type.hpp"
#include "renderer/yaml_renderer.hpp"

namespace idval {

void yaml_renderer::render(std::span<const validation_result> results, std::ostream &out) const
{
    YAML::Emitter emitter(out);
    emitter.SetIndent(2);
    emitter.SetMapFormat(YAML::Block);
    emitter.SetSeqFormat(YAML::Block);

    emitter << YAML::BeginSeq;
    for (const auto &result : results) {
        emitter << YAML::BeginMap;
        // Quoted so numeric-looking identifiers load back as strings
        emitter << YAML::Key << "id" << YAML::Value << YAML::DoubleQuoted << result.identifier;
        emitter << YAML::Key << "type" << YAML::Value
                << std::string{identifier_type_to_string(result.type)};
        emitter << YAML::Key << "valid" << YAML::Value << result.valid;

        emitter << YAML::Key << "flags" << YAML::Value << YAML::BeginSeq;
        for (auto flag : result.flags) { emitter << std::string{fraud_flag_to_string(flag)}; }
        emitter << YAML::EndSeq;

        emitter << YAML::EndMap;
    }
    emitter << YAML::EndSeq;
    out << '\n';
}

} // namespace idval
