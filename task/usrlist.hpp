#pragma once

#include <cstddef>
#include <cstdint>

namespace convgate {

struct list_head {
    struct list_head* next = this;
    struct list_head* prev = this;
};

static inline void INIT_LIST_HEAD(struct list_head* list)
{
    list->next = list;
    list->prev = list;
}

/*
 * Insert a new entry between two known consecutive entries.
 */
static inline void __list_add(struct list_head* pnew, struct list_head* prev, struct list_head* next)
{
    next->prev = pnew;
    pnew->next = next;
    pnew->prev = prev;
    prev->next = pnew;
}

/**
 * list_add_tail - queue @pnew in front of @head (FIFO order).
 */
static inline void list_add_tail(struct list_head* pnew, struct list_head* head)
{
    __list_add(pnew, head->prev, head);
}

static inline void __list_del(struct list_head* prev, struct list_head* next)
{
    next->prev = prev;
    prev->next = next;
}

/**
 * list_del - unlink @entry and leave it self-linked, so a second list_del is harmless.
 */
static inline void list_del(struct list_head* entry)
{
    __list_del(entry->prev, entry->next);
    INIT_LIST_HEAD(entry);
}

static inline int list_empty(const struct list_head* head)
{
    return head->next == head;
}

/**
 * list_splice_init - move every entry of @list to the tail of @head, @list becomes empty.
 */
static inline void list_splice_tail_init(struct list_head* list, struct list_head* head)
{
    if (list_empty(list))
        return;
    struct list_head* first = list->next;
    struct list_head* last  = list->prev;
    first->prev             = head->prev;
    head->prev->next        = first;
    last->next              = head;
    head->prev              = last;
    INIT_LIST_HEAD(list);
}

template <class T, class M> static inline constexpr std::ptrdiff_t offset_of(const M T::* member)
{
    return reinterpret_cast<std::ptrdiff_t>(&(reinterpret_cast<T*>(0)->*member));
}

template <class T, class M> static inline constexpr T* owner_of(M* ptr, const M T::* member)
{
    return reinterpret_cast<T*>(reinterpret_cast<std::intptr_t>(ptr) - offset_of(member));
}

#define container_of(ptr, type, member) owner_of(ptr, &type::member)

#define list_entry(ptr, type, member) container_of(ptr, type, member)

/**
 * list_first_entry - first element of a non-empty list.
 */
#define list_first_entry(ptr, type, member) list_entry((ptr)->next, type, member)

} // namespace convgate
