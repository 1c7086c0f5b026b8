#pragma once


/*
    -------------------------------------
    Stanza sequences - interface and adapters
    -------------------------------------
    - `sequence<T>` is a read-only, indexable sequence interface. Declared
      types such as `seq_ptr<int>` (a `shared_ptr<const sequence<int>>`) are
      what application code hands around; the serializer cannot construct
      them because they are abstract.
    - `list_sequence<T>` is the vector-backed implementation.
    - `delegating_sequence<T>` is the concrete surrogate composed for a
      declared `sequence<T>`. It exposes elements of the surrogate element
      type as `std::any`:
        * built from an original sequence and the element provider, it wraps
          each element lazily when enumerated
        * built empty by the serializer, it accepts surrogate elements via
          `add`, keeps them for enumeration, and stores each one unwrapped
          as a `T`
        * `unwrap()` returns the declared `seq_ptr<T>`
*/

#include <any>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <vector>

#include "stanza/error.hpp"
#include "stanza/types.hpp"
#include "stanza/wrapper.hpp"

/// @defgroup StanzaSequence Sequences
/// @ingroup Stanza
/// @brief Sequence interface and the surrogate composed for it

namespace Stanza {

    /// @ingroup StanzaSequence
    /// @brief Read-only indexable sequence of `T`.
    template<typename T>
    class sequence {
    public:
        using value_type = T;

        class iterator {
        public:
            using iterator_concept = std::input_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;

            iterator() = default;
            iterator(const sequence* seq, std::size_t idx) noexcept : m_Seq{ seq }, m_Idx{ idx } {}

            T operator*() const { return m_Seq->at(m_Idx); }
            iterator& operator++() { ++m_Idx; return *this; }
            iterator operator++(int) { auto tmp = *this; ++m_Idx; return tmp; }
            friend bool operator==(const iterator&, const iterator&) = default;

        private:
            const sequence* m_Seq = nullptr;
            std::size_t m_Idx = 0;
        };

        virtual ~sequence() = default;

        [[nodiscard]] virtual std::size_t size() const = 0;

        /// @brief Element at @p idx, produced by value.
        /// @throws std::out_of_range if @p idx >= size()
        [[nodiscard]] virtual T at(std::size_t idx) const = 0;

        [[nodiscard]] bool empty() const { return size() == 0; }
        [[nodiscard]] iterator begin() const { return iterator{ this, 0 }; }
        [[nodiscard]] iterator end() const { return iterator{ this, size() }; }
    };

    /// @ingroup StanzaSequence
    /// @brief Declared, reference-shaped handle to a sequence
    template<typename T>
    using seq_ptr = std::shared_ptr<const sequence<T>>;

    /// @ingroup StanzaSequence
    /// @brief `sequence<T>` over a `std::vector<T>`.
    template<typename T>
    class list_sequence final : public sequence<T> {
    public:
        list_sequence() = default;
        explicit list_sequence(std::vector<T> values) : m_Values{ std::move(values) } {}

        [[nodiscard]] std::size_t size() const override { return m_Values.size(); }
        [[nodiscard]] T at(std::size_t idx) const override { return m_Values.at(idx); }

        [[nodiscard]] const std::vector<T>& values() const noexcept { return m_Values; }

    private:
        std::vector<T> m_Values;
    };

    /// @ingroup StanzaSequence
    /// @brief Creates a declared sequence handle over @p values.
    template<typename T>
    [[nodiscard]] seq_ptr<T> make_sequence(std::vector<T> values) {
        return std::make_shared<const list_sequence<T>>(std::move(values));
    }

    template<typename T>
    [[nodiscard]] seq_ptr<T> make_sequence(std::initializer_list<T> values) {
        return make_sequence(std::vector<T>(values));
    }

    /// @ingroup StanzaSequence
    /// @brief Copies the elements of @p seq into a vector.
    template<typename T>
    [[nodiscard]] std::vector<T> to_vector(const sequence<T>& seq) {
        std::vector<T> out;
        out.reserve(seq.size());
        for (auto&& v : seq) out.push_back(std::move(v));
        return out;
    }

    /// @ingroup StanzaSequence
    /// @brief Concrete surrogate for a declared `sequence<T>`.
    ///
    /// @details
    /// Enumerates elements of the surrogate element type as `std::any`. The
    /// surrogate element type is the wrapping type of the element provider,
    /// or `T` itself when elements need no wrapping.
    template<typename T>
    class delegating_sequence final : public sequence<std::any> {
    public:
        /// @brief Surrogate over an existing sequence; elements are wrapped lazily.
        delegating_sequence(seq_ptr<T> source, std::shared_ptr<const WrapperProvider> inner)
            : m_Source{ std::move(source) },
              m_Inner{ std::move(inner) },
              m_Wrapped{ m_Inner ? m_Inner->wrapping_type() : type_of<T>() } {}

        /// @brief Empty surrogate to be populated through `add`.
        explicit delegating_sequence(type_ref wrapped_element)
            : m_Wrapped{ wrapped_element ? wrapped_element : type_of<T>() } {}

        [[nodiscard]] std::size_t size() const override {
            return m_Source ? m_Source->size() : m_Items.size();
        }

        /// @brief Element @p idx as a value of the surrogate element type (or none).
        ///        Over a source sequence, the element is wrapped through the
        ///        element provider.
        [[nodiscard]] std::any at(std::size_t idx) const override {
            if (!m_Source) return m_Surrogates.at(idx);
            std::any item = box(m_Source->at(idx));
            return m_Inner ? m_Inner->wrap(item) : item;
        }

        /// @brief Accepts one surrogate element, unwraps it and stores it as a `T`.
        ///
        /// @details
        /// A surrogate over a source sequence first takes over the source
        /// elements, wrapped, so enumeration keeps yielding surrogate elements.
        ///
        /// @throws configuration_error if the surrogate element type differs
        ///         from `T` and cannot be unwrapped
        void add(const std::any& item) {
            if (m_Source) {
                m_Surrogates.reserve(m_Source->size() + 1);
                for (std::size_t i = 0; i < m_Source->size(); ++i) m_Surrogates.push_back(at(i));
                m_Items = to_vector(*m_Source);
                m_Source.reset();
            }

            if (m_Wrapped == type_of<T>()) {
                m_Items.push_back(unbox<T>(item));
            } else {
                if (!m_Wrapped->is_unwrappable())
                    throw configuration_error{ "Surrogate element type '" + m_Wrapped->name + "' cannot be unwrapped" };
                m_Items.push_back(unbox<T>(m_Wrapped->unwrap(item, type_of<T>())));
            }
            m_Surrogates.push_back(item);
        }

        /// @brief The declared sequence: the original, or the collected elements.
        [[nodiscard]] seq_ptr<T> unwrap() const {
            if (m_Source) return m_Source;
            return make_sequence(m_Items);
        }

        [[nodiscard]] type_ref wrapped_element_type() const noexcept { return m_Wrapped; }

    private:
        seq_ptr<T> m_Source;
        std::shared_ptr<const WrapperProvider> m_Inner;
        type_ref m_Wrapped;
        std::vector<T> m_Items;
        std::vector<std::any> m_Surrogates;
    };

} // namespace Stanza
