#pragma once


/*
    ---------------------------------
    Stanza::node - XML element DOM node
    ---------------------------------
    The `Stanza::node` type represents one XML element:
        - its qualified name (`prefix:local` or `local`)
        - its attributes, keyed by qualified name
        - its character data, concatenated across text and CDATA runs
        - its child elements, in document order

    Comments and processing instructions are not kept.

    -----------------
    Memory Management
    -----------------
    - `node` is allocator-aware and uses `std::pmr::memory_resource` for the
      name, text, attributes and children it owns
    - Copy construction deep-copies the subtree into the allocator of
      the source; move construction steals the allocator and storage
    - Assignment keeps the allocator of the target, as `std::pmr`
      containers do

    -------------
    Thread-Safety
    -------------
    - Separate `node` instances may be used from multiple threads
    - Concurrent mutation of one instance must be externally synchronized
*/

/// @defgroup Stanza Stanza XML Adaptation Library
/// @brief Core types and functions for Stanza

/// @defgroup StanzaNode DOM Node
/// @ingroup Stanza

#include <cstddef>
#include <map>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"

namespace Stanza {

    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    template<class Key, class T, class Compare = std::less<>>
    using pmr_map = std::pmr::map<Key, T, Compare>;

    /// @ingroup StanzaNode
    /// @brief String type used by Stanza::node (allocator-aware)
    using string = std::pmr::string;

    struct node;
    using allocator_type = std::pmr::polymorphic_allocator<node>;

    /// @ingroup StanzaNode
    /// @brief Attribute map of an element, keyed by qualified name
    using attribute_map = pmr_map<string, string>;

    /// @ingroup StanzaNode
    /// @brief Child element list of an element
    using node_list = pmr_vector<node>;

    /// @ingroup StanzaNode
    /// @brief Namespace of `xsi:nil` and friends.
    inline constexpr std::string_view xsi_namespace = "http://www.w3.org/2001/XMLSchema-instance";

    /// @ingroup StanzaNode
    /// @brief One XML element and its subtree.
    struct node {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @ingroup StanzaNode
        /// @brief Constructs an unnamed element using the given memory resource
        STANZA_API explicit node(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StanzaNode
        /// @brief Constructs an empty element with the given qualified name
        STANZA_API explicit node(std::string_view name, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        STANZA_API node(const node& other);
        STANZA_API node(node&& other) noexcept;
        STANZA_API node& operator=(const node& other);
        STANZA_API node& operator=(node&& other) noexcept;

        // ------------------------------------------------------------
        // Names
        // ------------------------------------------------------------

        /// @brief Qualified name as written in the document.
        [[nodiscard]] const string& name() const noexcept { return m_Name; }

        /// @brief Name without its namespace prefix.
        [[nodiscard]] STANZA_API std::string_view local_name() const noexcept;

        /// @brief Namespace prefix, empty when the name is unprefixed.
        [[nodiscard]] STANZA_API std::string_view prefix() const noexcept;

        STANZA_API void set_name(std::string_view name);

        // ------------------------------------------------------------
        // Content
        // ------------------------------------------------------------

        [[nodiscard]] const string& text() const noexcept { return m_Text; }
        STANZA_API void append_text(std::string_view text);

        [[nodiscard]] const attribute_map& attributes() const noexcept { return m_Attributes; }

        /// @brief Sets an attribute; returns false if it was already present.
        STANZA_API bool set_attribute(std::string_view name, std::string_view value);

        /// @brief Looks up an attribute by qualified name.
        /// @return Pointer to the value, or nullptr if absent
        [[nodiscard]] STANZA_API const string* attribute(std::string_view name) const;

        /// @brief Resolves a namespace prefix using the `xmlns` declarations on this element.
        /// @return Pointer to the namespace URI, or nullptr if not declared here
        [[nodiscard]] STANZA_API const string* namespace_for(std::string_view prefix) const;

        /// @brief True when the element carries `xsi:nil="true"`.
        ///
        /// @details
        /// Any attribute whose local name is `nil` and whose value is `true`
        /// or `1` is accepted; the `xsi` prefix is not required to be
        /// declared on the element itself.
        [[nodiscard]] STANZA_API bool is_nil() const;

        [[nodiscard]] const node_list& children() const noexcept { return m_Children; }
        [[nodiscard]] node_list& children() noexcept { return m_Children; }

        /// @brief Appends a child element and returns a reference to it.
        STANZA_API node& append_child(node child);

        /// @brief Finds the first child whose local name equals @p local.
        [[nodiscard]] STANZA_API const node* find_child(std::string_view local) const;

        [[nodiscard]] std::size_t size() const noexcept { return m_Children.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_Children.empty() && m_Text.empty(); }

        /// @brief Structural equality: name, attributes, text and children.
        STANZA_API friend bool operator==(const node& lhs, const node& rhs);

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        string m_Name;
        string m_Text;
        attribute_map m_Attributes;
        node_list m_Children;
    };

} // namespace Stanza
