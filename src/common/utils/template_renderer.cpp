// common/utils/template_renderer.cpp
#include "template_renderer.h"
#include <inja/inja.hpp>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace agenttrace {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    // Markdown headings start with "##"; line statements need a prefix that never appears in reports.
    env_.set_line_statement("%%%");
    // Reports are plain text; keep newlines exactly as written in the template.
    env_.set_trim_blocks(false);
    env_.set_lstrip_blocks(false);

    configure_security();
    register_callbacks();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

void InjaTemplateRenderer::register_callbacks() {
    env_.add_callback("fixed", 2, [](inja::Arguments& args) -> nlohmann::json {
        const auto& value = *args.at(0);
        int digits = args.at(1)->get<int>();
        double number = value.is_number() ? value.get<double>() : 0.0;
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(digits < 0 ? 0 : digits) << number;
        return oss.str();
    });

    env_.add_callback("pad", 2, [](inja::Arguments& args) -> nlohmann::json {
        const auto& value = *args.at(0);
        std::string text = value.is_string() ? value.get<std::string>() : value.dump();
        auto width = args.at(1)->get<std::size_t>();
        if (text.size() < width) {
            text.append(width - text.size(), ' ');
        }
        return text;
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const nlohmann::json& data) {
    static InjaTemplateRenderer renderer;
    return renderer.render_with_env(template_str, data);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const nlohmann::json& data) {
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

} // namespace agenttrace
