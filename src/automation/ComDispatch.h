#pragma once

#ifdef _WIN32

#include <initializer_list>
#include <string>
#include <vector>

#include <windows.h>
#include <oleauto.h>

namespace hwpmcp::automation::com
{
    /// UTF-8 to UTF-16
    std::wstring toWide(std::string const & text);

    /// UTF-16 to UTF-8
    std::string toUtf8(wchar_t const * text, int length = -1);

    /// Initializes a single-threaded apartment for the lifetime of the object
    class ApartmentScope
    {
      public:
        ApartmentScope();
        ~ApartmentScope();

        ApartmentScope(ApartmentScope const &) = delete;
        ApartmentScope & operator=(ApartmentScope const &) = delete;

      private:
        bool m_initialized{false};
    };

    class DispatchObject;

    /// Owning VARIANT
    class Variant
    {
      public:
        Variant();
        explicit Variant(std::string const & text);
        explicit Variant(std::wstring const & text);
        explicit Variant(int value);
        explicit Variant(bool value);
        explicit Variant(DispatchObject const & object);
        ~Variant();

        Variant(Variant const & other);
        Variant & operator=(Variant const & other);
        Variant(Variant && other) noexcept;
        Variant & operator=(Variant && other) noexcept;

        VARIANT & get()
        {
            return m_value;
        }

        VARIANT const & get() const
        {
            return m_value;
        }

        /// @throws AutomationError if the value cannot be coerced
        [[nodiscard]] bool toBool() const;
        [[nodiscard]] int toInt() const;
        [[nodiscard]] std::string toString() const;
        [[nodiscard]] DispatchObject toObject() const;

      private:
        VARIANT m_value;
    };

    /**
     * @brief Owning IDispatch pointer with late bound member access
     *
     * Failing calls throw through throwAutomationFailure() so that rejected calls surface as
     * BlockedByUIError.
     */
    class DispatchObject
    {
      public:
        DispatchObject() = default;

        /// Takes over the reference held by dispatch
        explicit DispatchObject(IDispatch * dispatch);
        ~DispatchObject();

        DispatchObject(DispatchObject const & other);
        DispatchObject & operator=(DispatchObject const & other);
        DispatchObject(DispatchObject && other) noexcept;
        DispatchObject & operator=(DispatchObject && other) noexcept;

        /// Creates the out-of-process server registered under progId
        static DispatchObject create(std::string const & progId);

        [[nodiscard]] IDispatch * get() const
        {
            return m_dispatch;
        }

        Variant call(std::string const & name, std::vector<Variant> args = {}) const;

        [[nodiscard]] Variant property(std::string const & name) const;

        [[nodiscard]] DispatchObject object(std::string const & name) const;

        void setProperty(std::string const & name, Variant value) const;

      private:
        Variant invoke(std::string const & name, WORD flags, std::vector<Variant> args) const;

        IDispatch * m_dispatch{nullptr};
    };
}

#endif
