////////////////////////////////////////////////////////////////////////////////
/// Time-ordered FIFO
///
/// An ordered queue of (key, value) pairs, released by ascending key, tuned
/// for the case where keys already arrive in non-decreasing order (packet
/// release timestamps in a delay/reorder emulator a la Linux sch_netem):
///  - in-order insertions are appended to a plain double-ended 'tail' in O(1)
///  - out-of-order insertions (key < key of the last tail element) go into an
///    ordered 'reorder' map of per-key FIFO buckets in O(log R) where R is the
///    number of distinct out-of-order keys currently held
///  - pop/peek pick the smaller of the two tier fronts (or, with
///    tfifo_ordering::reorder_first, drain the reorder map unconditionally
///    first, as sch_netem's rbtree+list tfifo does).
///
/// Equal keys are released in insertion order regardless of the tier they
/// landed in (ascending_merge only).
/// Not thread safe: the owner serializes access.
////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include "abi.hpp"
#include "komparator.hpp"

#include <boost/assert.hpp>
#include <boost/container/deque.hpp>
#include <boost/container/map.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace delayq
{
//------------------------------------------------------------------------------

enum class tfifo_ordering : std::uint8_t {
    ascending_merge, // default - true minimum of both tier fronts, stable for equal keys
    reorder_first,   // sch_netem compatible - any reordered pair goes before the tail
};

struct tfifo_options
{
    tfifo_ordering ordering{ /*first as default*/ };
}; // struct tfifo_options


////////////////////////////////////////////////////////////////////////////////
/// tfifo
////////////////////////////////////////////////////////////////////////////////

template <std::copy_constructible Key, typename T, typename Compare = std::less<Key>, tfifo_options options = {}>
requires( std::move_constructible<T> && std::strict_weak_order<Compare const &, Key const &, Key const &> )
class tfifo
    :
    private Komparator<Compare>
{
private:
    using komparator = Komparator<Compare>;

public:
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<Key, T>;
    using key_compare     = Compare;
    using size_type       = std::size_t;
    using const_reference = std::pair<key_type const &, mapped_type const &>;
    using key_const_arg   = const_arg_t<key_type>;

    static tfifo_ordering constexpr ordering{ options.ordering };

private:
    using tail_sequence = boost::container::deque<value_type>;
    using reorder_fifo  = boost::container::deque<mapped_type>;
    using reorder_map   = boost::container::map<key_type, reorder_fifo, key_compare>;

public:
    tfifo() = default;
    explicit tfifo( key_compare const & compare ) : komparator{ compare }, reordered_{ compare } {}

    tfifo( tfifo const &  ) = default;
    tfifo( tfifo       && other ) noexcept( std::is_nothrow_move_constructible_v<key_compare> )
        : komparator{ std::move( other.comp() ) }, tail_{ std::move( other.tail_ ) }, reordered_{ std::move( other.reordered_ ) }, size_{ std::exchange( other.size_, 0 ) }
    {}

    tfifo & operator=( tfifo const &  ) = default;
    tfifo & operator=( tfifo       && other ) noexcept( std::is_nothrow_move_assignable_v<key_compare> )
    {
        this->comp() = std::move( other.comp()      );
        tail_        = std::move( other.tail_       );
        reordered_   = std::move( other.reordered_  );
        size_        = std::exchange( other.size_, 0 );
        return *this;
    }

    [[ nodiscard ]] size_type size () const noexcept { return size_;      }
    [[ nodiscard ]] bool      empty() const noexcept { return size_ == 0; }

    // tier introspection
    [[ nodiscard ]] size_type tail_size     () const noexcept { return tail_.size();         }
    [[ nodiscard ]] size_type reordered_size() const noexcept { return size_ - tail_.size(); }
    [[ nodiscard ]] size_type reordered_keys() const noexcept { return reordered_.size();    }

    [[ nodiscard ]] key_compare key_comp() const { return this->comp(); }

    template <typename ... Args>
    requires std::constructible_from<mapped_type, Args && ...>
    void emplace( key_type key, Args && ... args )
    {
        if ( tail_.empty() || this->geq( key, tail_.back().first ) ) [[ likely ]]
        {
            tail_.emplace_back
            (
                std::piecewise_construct,
                std::forward_as_tuple( std::move( key ) ),
                std::forward_as_tuple( std::forward<Args>( args )... )
            );
        }
        else
        {
            emplace_reordered( std::move( key ), std::forward<Args>( args )... );
        }
        ++size_;
        check_invariants();
    }

    void insert( key_type key, mapped_type value ) { emplace( std::move( key ), std::move( value ) ); }
    void insert( value_type && pair )              { emplace( std::move( pair.first ), std::move( pair.second ) ); }

    /// The returned references stay valid until the next pop(), pop_due() or clear().
    [[ nodiscard ]] std::optional<const_reference> peek() const noexcept
    {
        if ( empty() )
            return std::nullopt;
        if ( next_is_reordered() )
        {
            auto const & bucket{ *reordered_.begin() };
            return const_reference{ bucket.first, bucket.second.front() };
        }
        auto const & head{ tail_.front() };
        return const_reference{ head.first, head.second };
    }

    /// Checked peek, with the same reference lifetime as peek().
    /// \throws std::out_of_range if the queue is empty
    [[ nodiscard ]] const_reference front() const
    {
        if ( empty() ) [[ unlikely ]]
            detail::throw_out_of_range( "delayq::tfifo::front() called on an empty queue" );
        return *peek();
    }

    std::optional<value_type> pop()
    {
        if ( empty() )
            return std::nullopt;

        std::optional<value_type> result;
        if ( next_is_reordered() )
        {
            auto const bucket{ reordered_.begin() };
            auto &     fifo  { bucket->second };
            BOOST_ASSERT_MSG( !fifo.empty(), "Drained buckets must not linger in the reorder map" );
            // map keys are immutable: the key is copied out
            result.emplace( bucket->first, std::move( fifo.front() ) );
            fifo.pop_front();
            if ( fifo.empty() )
                reordered_.erase( bucket );
        }
        else
        {
            result.emplace( std::move( tail_.front() ) );
            tail_.pop_front();
        }
        --size_;
        check_invariants();
        return result;
    }

    /// Releases the next pair only if it is due, i.e. its key does not exceed
    /// 'bound' (e.g. the current virtual time).
    std::optional<value_type> pop_due( key_const_arg bound )
    {
        auto const next{ peek() };
        if ( !next || !this->leq( next->first, bound ) )
            return std::nullopt;
        return pop();
    }

    void clear() noexcept
    {
        tail_     .clear();
        reordered_.clear();
        size_ = 0;
    }

    void swap( tfifo & other ) noexcept( std::is_nothrow_swappable_v<key_compare> )
    {
        using std::swap;
        swap( this->comp(), other.comp()      );
        swap( tail_       , other.tail_       );
        swap( reordered_  , other.reordered_  );
        swap( size_       , other.size_       );
    }
    friend void swap( tfifo & left, tfifo & right ) noexcept( noexcept( left.swap( right ) ) ) { left.swap( right ); }

private:
    template <typename ... Args>
    void emplace_reordered( key_type && key, Args && ... args )
    {
        auto const [bucket, created]{ reordered_.try_emplace( std::move( key ) ) };
        try
        {
            bucket->second.emplace_back( std::forward<Args>( args )... );
        }
        catch ( ... )
        {
            if ( created )
                reordered_.erase( bucket );
            throw;
        }
    }

    [[ gnu::pure ]] bool next_is_reordered() const noexcept
    {
        BOOST_ASSERT( !empty() );
        if ( reordered_.empty() )
            return false;
        if constexpr ( ordering == tfifo_ordering::reorder_first )
            return true;
        else // ties go to the tail: its front is always the older of two equal keys
            return tail_.empty() || this->le( reordered_.begin()->first, tail_.front().first );
    }

    void check_invariants() const noexcept
    {
        BOOST_ASSERT( size_ >= tail_.size() );
        BOOST_ASSERT( ( size_ == tail_.size() ) == reordered_.empty() );
        BOOST_ASSERT_MSG( !tail_.empty() || reordered_.empty(), "Reordered pairs outlived the tail" );
    }

private:
    tail_sequence tail_;
    reorder_map   reordered_;
    size_type     size_{ 0 };
}; // class tfifo

//------------------------------------------------------------------------------
} // namespace delayq
//------------------------------------------------------------------------------
