/**
 * @file node_store.hpp
 * @brief Арена узлов деревьев
 *
 * Узлы адресуются плотными целочисленными идентификаторами:
 * - id 0 зарезервирован как пустой узел (отсутствующий потомок)
 * - новые id выдаются монотонно (++nodes_count) и никогда не переиспользуются
 * - удалённый узел становится надгробием: слот обнуляется,
 *   deleted_count увеличивается
 *
 * @tparam Node Тип узла; Node{} должен описывать пустой узел
 */

#pragma once

#include "../core/types.hpp"

#include <vector>

namespace arbor::trees {

template<typename Node>
class NodeStore {
public:
    NodeStore() {
        // Слот 0 - пустой узел
        nodes_.emplace_back();
    }

    /**
     * @brief Разместить новый узел
     *
     * @param node Узел
     * @return NodeId Новый идентификатор (всегда > 0)
     */
    NodeId allocate(Node node) {
        nodes_.push_back(std::move(node));
        return static_cast<NodeId>(nodes_.size() - 1);
    }

    /**
     * @brief Получить узел
     *
     * Для id 0, надгробий и неизвестных id возвращает пустой узел.
     */
    [[nodiscard]] const Node& get(NodeId id) const noexcept {
        if (id >= nodes_.size()) {
            return nodes_[0];
        }
        return nodes_[static_cast<std::size_t>(id)];
    }

    /**
     * @brief Изменяемый доступ к живому узлу
     *
     * @warning id должен быть выдан allocate() и не удалён
     */
    [[nodiscard]] Node& at(NodeId id) noexcept {
        return nodes_[static_cast<std::size_t>(id)];
    }

    /**
     * @brief Заменить узел
     */
    void set(NodeId id, Node node) {
        if (id == 0 || id >= nodes_.size()) {
            return;
        }
        nodes_[static_cast<std::size_t>(id)] = std::move(node);
    }

    /**
     * @brief Удалить узел (надгробие)
     */
    void tombstone(NodeId id) {
        if (id == 0 || id >= nodes_.size()) {
            return;
        }
        nodes_[static_cast<std::size_t>(id)] = Node{};
        ++deleted_count_;
    }

    /**
     * @brief Сколько id было выдано
     */
    [[nodiscard]] uint64_t nodes_count() const noexcept {
        return static_cast<uint64_t>(nodes_.size() - 1);
    }

    /**
     * @brief Сколько узлов удалено
     */
    [[nodiscard]] uint64_t deleted_count() const noexcept {
        return deleted_count_;
    }

    /**
     * @brief Количество живых узлов
     */
    [[nodiscard]] uint64_t live_count() const noexcept {
        return nodes_count() - deleted_count_;
    }

    [[nodiscard]] bool empty() const noexcept {
        return live_count() == 0;
    }

private:
    std::vector<Node> nodes_;
    uint64_t deleted_count_{0};
};

} // namespace arbor::trees
