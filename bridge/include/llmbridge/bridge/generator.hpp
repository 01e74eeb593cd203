#ifndef LLMBRIDGE_BRIDGE_GENERATOR_HPP
#define LLMBRIDGE_BRIDGE_GENERATOR_HPP

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <utility>

namespace llmbridge::bridge {

  enum class Control {
    // Element (if any) is yielded, the sequence goes on.
    CONTINUE,
    // Element is yielded and the sequence ends.
    LAST,
    // Sequence ends without an element.
    HALT
  };

  template <typename T, typename State>
  struct Step {
    std::optional<T> element;
    State state;
    Control control;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Lazy, single-pass sequence defined by init, step and cleanup functions.
  ///
  /// Init runs on the first pull. Step receives the current state and returns the
  /// next one; a step without an element and without halting is repeated. Cleanup
  /// runs exactly once on the final state: after the last element, on halt, or when
  /// the consumer closes or destroys an initialized sequence.
  ////////////////////////////////////////////////////////////////////////////////
  template <typename T, typename State>
  class Generator {
  public:
    using init_t = std::function<State()>;
    using step_t = std::function<Step<T, State>(State&&)>;
    using cleanup_t = std::function<void(State&)>;

    class iterator {
    public:
      using iterator_category = std::input_iterator_tag;
      using value_type = T;
      using difference_type = std::ptrdiff_t;
      using pointer = const T*;
      using reference = const T&;

      iterator() = default;

      iterator(Generator* gen) : _gen(gen)
      {
        _advance();
      }

      reference operator*() const
      {
        return _current.value();
      }

      pointer operator->() const
      {
        return &_current.value();
      }

      iterator& operator++()
      {
        _advance();
        return *this;
      }

      void operator++(int)
      {
        _advance();
      }

      bool operator==(const iterator& other) const
      {
        return _gen == other._gen;
      }

    private:
      void _advance()
      {
        _current = _gen->next();
        if (!_current.has_value()) {
          _gen = nullptr;
        }
      }

      Generator* _gen{};
      std::optional<T> _current;
    };

    Generator(init_t init, step_t step, cleanup_t cleanup)
        : _init(std::move(init)), _step(std::move(step)), _cleanup(std::move(cleanup))
    {
    }

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    Generator(Generator&& obj) noexcept
        : _init(std::move(obj._init)), _step(std::move(obj._step)),
          _cleanup(std::move(obj._cleanup)), _state(std::move(obj._state)),
          _finished(obj._finished)
    {
      obj._state.reset();
      obj._finished = true;
    }

    Generator& operator=(Generator&& obj) noexcept
    {
      if (this != &obj) {
        close();
        _init = std::move(obj._init);
        _step = std::move(obj._step);
        _cleanup = std::move(obj._cleanup);
        _state = std::move(obj._state);
        _finished = obj._finished;
        obj._state.reset();
        obj._finished = true;
      }
      return *this;
    }

    ~Generator()
    {
      close();
    }

    std::optional<T> next()
    {
      if (_finished) {
        return std::nullopt;
      }

      if (!_state.has_value()) {
        _state.emplace(_init());
      }

      while (true) {
        Step<T, State> step = _step(std::move(_state.value()));
        _state.emplace(std::move(step.state));

        switch (step.control) {
        case Control::CONTINUE:
          if (step.element.has_value()) {
            return std::move(step.element);
          }
          break;
        case Control::LAST:
          _finish();
          return std::move(step.element);
        case Control::HALT:
          _finish();
          return std::nullopt;
        }
      }
    }

    // Stops the sequence; runs cleanup if it was initialized.
    void close()
    {
      if (!_finished) {
        _finish();
      }
    }

    iterator begin()
    {
      return iterator{this};
    }

    iterator end()
    {
      return iterator{};
    }

    bool started() const
    {
      return _state.has_value();
    }

    bool finished() const
    {
      return _finished;
    }

    // Latest state, available after the first pull.
    const std::optional<State>& state() const
    {
      return _state;
    }

  private:
    void _finish()
    {
      _finished = true;
      if (_state.has_value() && _cleanup) {
        _cleanup(_state.value());
      }
    }

    init_t _init;
    step_t _step;
    cleanup_t _cleanup;

    std::optional<State> _state;

    bool _finished{};
  };

} // namespace llmbridge::bridge

#endif
