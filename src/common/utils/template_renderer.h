#ifndef AGENTTRACE_COMMON_UTILS_TEMPLATE_RENDERER_H
#define AGENTTRACE_COMMON_UTILS_TEMPLATE_RENDERER_H

#include <nlohmann/json.hpp>
#include <inja/inja.hpp>
#include <string>
#include <string_view>
#include <filesystem> // Required by Inja for set_include_callback

namespace agenttrace {

// Renders the text reports (Mermaid markdown document, run summary) from inja templates.
// Besides the inja builtins the environment provides:
//   fixed(value, digits)   -> number formatted with a fixed number of decimals
//   pad(value, width)      -> string left-aligned and padded with spaces to width
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 静态方法：使用默认环境渲染模板
    static std::string render(std::string_view template_str, const nlohmann::json& data);

    std::string render_with_env(std::string_view template_str, const nlohmann::json& data);

private:
    inja::Environment env_;
    void configure_security(); // includes are disabled
    void register_callbacks();
};

} // namespace agenttrace

#endif // AGENTTRACE_COMMON_UTILS_TEMPLATE_RENDERER_H
