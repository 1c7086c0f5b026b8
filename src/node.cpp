#include "stanza/node.hpp"

#include <algorithm>


namespace Stanza {

    node::node(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Name{ res }, m_Text{ res }, m_Attributes{ res }, m_Children{ res } {}

    node::node(std::string_view name, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Name{ name.begin(), name.end(), res }, m_Text{ res }, m_Attributes{ res }, m_Children{ res } {}

    node::node(const node& other)
        : m_MemRes{ other.m_MemRes },
          m_Name{ other.m_Name, other.m_MemRes },
          m_Text{ other.m_Text, other.m_MemRes },
          m_Attributes{ other.m_Attributes, other.m_MemRes },
          m_Children{ other.m_Children, other.m_MemRes } {}

    node::node(node&& other) noexcept
        : m_MemRes{ other.m_MemRes },
          m_Name{ std::move(other.m_Name) },
          m_Text{ std::move(other.m_Text) },
          m_Attributes{ std::move(other.m_Attributes) },
          m_Children{ std::move(other.m_Children) } {}

    node& node::operator=(const node& other) {
        if (this == &other) return *this;
        m_Name = other.m_Name;
        m_Text = other.m_Text;
        m_Attributes = other.m_Attributes;
        m_Children = other.m_Children;
        return *this;
    }

    node& node::operator=(node&& other) noexcept {
        if (this == &other) return *this;
        m_Name = std::move(other.m_Name);
        m_Text = std::move(other.m_Text);
        m_Attributes = std::move(other.m_Attributes);
        m_Children = std::move(other.m_Children);
        return *this;
    }

    std::string_view node::local_name() const noexcept {
        std::string_view n{ m_Name };
        auto colon = n.find(':');
        return colon == std::string_view::npos ? n : n.substr(colon + 1);
    }

    std::string_view node::prefix() const noexcept {
        std::string_view n{ m_Name };
        auto colon = n.find(':');
        return colon == std::string_view::npos ? std::string_view{} : n.substr(0, colon);
    }

    void node::set_name(std::string_view name) {
        m_Name.assign(name.begin(), name.end());
    }

    void node::append_text(std::string_view text) {
        m_Text.append(text.begin(), text.end());
    }

    bool node::set_attribute(std::string_view name, std::string_view value) {
        auto [it, inserted] = m_Attributes.try_emplace(string{ name.begin(), name.end(), m_MemRes },
                                                       string{ value.begin(), value.end(), m_MemRes });
        return inserted;
    }

    const string* node::attribute(std::string_view name) const {
        auto it = m_Attributes.find(name);
        if (it == m_Attributes.end()) return nullptr;
        return std::addressof(it->second);
    }

    const string* node::namespace_for(std::string_view prefix) const {
        if (prefix.empty()) return attribute("xmlns");
        string key{ "xmlns:", m_MemRes };
        key.append(prefix.begin(), prefix.end());
        return attribute(key);
    }

    bool node::is_nil() const {
        for (const auto& [k, v] : m_Attributes) {
            std::string_view key{ k };
            auto colon = key.find(':');
            std::string_view local = colon == std::string_view::npos ? key : key.substr(colon + 1);
            if (local == "nil" && key != "xmlns:nil") return v == "true" || v == "1";
        }
        return false;
    }

    node& node::append_child(node child) {
        return m_Children.emplace_back(std::move(child));
    }

    const node* node::find_child(std::string_view local) const {
        auto it = std::ranges::find_if(m_Children, [&](const node& c) { return c.local_name() == local; });
        if (it == m_Children.end()) return nullptr;
        return std::addressof(*it);
    }

    bool operator==(const node& lhs, const node& rhs) {
        return lhs.m_Name == rhs.m_Name
            && lhs.m_Text == rhs.m_Text
            && lhs.m_Attributes == rhs.m_Attributes
            && lhs.m_Children == rhs.m_Children;
    }

} // namespace Stanza
