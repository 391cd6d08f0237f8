#ifndef ROWBIND_SCANNABLE_CONTAINERS_H
#define ROWBIND_SCANNABLE_CONTAINERS_H

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "rowbind/scannable.h"

namespace rowbind {

    // 按值保存元素. 追加会使之前元素的地址失效, 但每个元素只在自己那一行被扫描.
    template <typename T>
    class ScannableVector : public IMultiScannable {
        static_assert(std::is_base_of_v<ISingleScannable, T>, "ScannableVector element must implement ISingleScannable");
        static_assert(std::is_default_constructible_v<T>, "ScannableVector element must be default constructible");

      public:
        using value_type = T;
        using iterator = typename std::vector<T>::iterator;
        using const_iterator = typename std::vector<T>::const_iterator;

        ScannableVector() = default;

        ISingleScannable& newElement() override {
            return m_items.emplace_back();
        }

        std::size_t size() const {
            return m_items.size();
        }
        bool empty() const {
            return m_items.empty();
        }
        void clear() {
            m_items.clear();
        }
        void reserve(std::size_t n) {
            m_items.reserve(n);
        }

        T& operator[](std::size_t i) {
            return m_items[i];
        }
        const T& operator[](std::size_t i) const {
            return m_items[i];
        }

        iterator begin() {
            return m_items.begin();
        }
        iterator end() {
            return m_items.end();
        }
        const_iterator begin() const {
            return m_items.begin();
        }
        const_iterator end() const {
            return m_items.end();
        }

        std::vector<T>& items() {
            return m_items;
        }
        const std::vector<T>& items() const {
            return m_items;
        }

      private:
        std::vector<T> m_items;
    };

    // 按指针保存元素, 元素地址在整个生命周期内稳定.
    template <typename T>
    class ScannablePtrVector : public IMultiScannable {
        static_assert(std::is_base_of_v<ISingleScannable, T>, "ScannablePtrVector element must implement ISingleScannable");

      public:
        using value_type = std::unique_ptr<T>;

        ScannablePtrVector() = default;

        ISingleScannable& newElement() override {
            m_items.push_back(createElement());
            return *m_items.back();
        }

        std::size_t size() const {
            return m_items.size();
        }
        bool empty() const {
            return m_items.empty();
        }
        void clear() {
            m_items.clear();
        }

        T& operator[](std::size_t i) {
            return *m_items[i];
        }
        const T& operator[](std::size_t i) const {
            return *m_items[i];
        }

        auto begin() {
            return m_items.begin();
        }
        auto end() {
            return m_items.end();
        }
        auto begin() const {
            return m_items.begin();
        }
        auto end() const {
            return m_items.end();
        }

        std::vector<std::unique_ptr<T>>& items() {
            return m_items;
        }
        const std::vector<std::unique_ptr<T>>& items() const {
            return m_items;
        }

      protected:
        virtual std::unique_ptr<T> createElement() {
            if constexpr (std::is_default_constructible_v<T>) {
                return std::make_unique<T>();
            } else {
                throw std::logic_error("ScannablePtrVector: element type is not default constructible, use FactoryScannable");
            }
        }

      private:
        std::vector<std::unique_ptr<T>> m_items;
    };

    // 元素由调用方提供的工厂创建, 可用于多态元素或需要构造参数的元素.
    template <typename T>
    class FactoryScannable : public ScannablePtrVector<T> {
      public:
        using Factory = std::function<std::unique_ptr<T>()>;

        explicit FactoryScannable(Factory factory) : m_factory(std::move(factory)) {
        }

      protected:
        std::unique_ptr<T> createElement() override {
            if (!m_factory) {
                throw std::logic_error("FactoryScannable: element factory is empty");
            }
            std::unique_ptr<T> element = m_factory();
            if (!element) {
                throw std::logic_error("FactoryScannable: element factory returned nullptr");
            }
            return element;
        }

      private:
        Factory m_factory;
    };

}  // namespace rowbind

#endif  // ROWBIND_SCANNABLE_CONTAINERS_H
