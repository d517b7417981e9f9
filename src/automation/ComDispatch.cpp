#ifdef _WIN32

#include "ComDispatch.h"
#include "../exceptions.h"

#include <algorithm>
#include <fmt/format.h>

namespace hwpmcp::automation::com
{
    std::wstring toWide(std::string const & text)
    {
        if (text.empty())
        {
            return {};
        }

        int const length = MultiByteToWideChar(
          CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
        if (length <= 0)
        {
            throw AutomationError(fmt::format("Text is not valid UTF-8: {}", text));
        }

        std::wstring wide(static_cast<size_t>(length), L'\0');
        MultiByteToWideChar(
          CP_UTF8, 0, text.data(), static_cast<int>(text.size()), wide.data(), length);
        return wide;
    }

    std::string toUtf8(wchar_t const * text, int length)
    {
        if (text == nullptr || length == 0)
        {
            return {};
        }

        int const size =
          WideCharToMultiByte(CP_UTF8, 0, text, length, nullptr, 0, nullptr, nullptr);
        if (size <= 0)
        {
            return {};
        }

        std::string narrow(static_cast<size_t>(size), '\0');
        WideCharToMultiByte(CP_UTF8, 0, text, length, narrow.data(), size, nullptr, nullptr);

        // Length -1 includes the terminator
        if (length < 0 && !narrow.empty() && narrow.back() == '\0')
        {
            narrow.pop_back();
        }
        return narrow;
    }

    ApartmentScope::ApartmentScope()
    {
        HRESULT const hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
        if (hr == RPC_E_CHANGED_MODE)
        {
            // Someone else owns the apartment of this thread, use it as it is
            return;
        }
        if (FAILED(hr))
        {
            throwAutomationFailure("CoInitializeEx", hr);
        }
        m_initialized = true;
    }

    ApartmentScope::~ApartmentScope()
    {
        if (m_initialized)
        {
            CoUninitialize();
        }
    }

    Variant::Variant()
    {
        VariantInit(&m_value);
    }

    Variant::Variant(std::string const & text)
    {
        VariantInit(&m_value);
        std::wstring const wide = toWide(text);
        m_value.vt = VT_BSTR;
        m_value.bstrVal = SysAllocStringLen(wide.data(), static_cast<UINT>(wide.size()));
    }

    Variant::Variant(std::wstring const & text)
    {
        VariantInit(&m_value);
        m_value.vt = VT_BSTR;
        m_value.bstrVal = SysAllocStringLen(text.data(), static_cast<UINT>(text.size()));
    }

    Variant::Variant(int value)
    {
        VariantInit(&m_value);
        m_value.vt = VT_I4;
        m_value.lVal = value;
    }

    Variant::Variant(bool value)
    {
        VariantInit(&m_value);
        m_value.vt = VT_BOOL;
        m_value.boolVal = value ? VARIANT_TRUE : VARIANT_FALSE;
    }

    Variant::Variant(DispatchObject const & object)
    {
        VariantInit(&m_value);
        m_value.vt = VT_DISPATCH;
        m_value.pdispVal = object.get();
        if (m_value.pdispVal != nullptr)
        {
            m_value.pdispVal->AddRef();
        }
    }

    Variant::~Variant()
    {
        VariantClear(&m_value);
    }

    Variant::Variant(Variant const & other)
    {
        VariantInit(&m_value);
        HRESULT const hr = VariantCopy(&m_value, &other.m_value);
        if (FAILED(hr))
        {
            throwAutomationFailure("VariantCopy", hr);
        }
    }

    Variant & Variant::operator=(Variant const & other)
    {
        if (this != &other)
        {
            Variant copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    Variant::Variant(Variant && other) noexcept
    {
        m_value = other.m_value;
        VariantInit(&other.m_value);
    }

    Variant & Variant::operator=(Variant && other) noexcept
    {
        if (this != &other)
        {
            VariantClear(&m_value);
            m_value = other.m_value;
            VariantInit(&other.m_value);
        }
        return *this;
    }

    bool Variant::toBool() const
    {
        VARIANT converted;
        VariantInit(&converted);
        HRESULT const hr = VariantChangeType(&converted, &m_value, 0, VT_BOOL);
        if (FAILED(hr))
        {
            throwAutomationFailure("VariantChangeType(VT_BOOL)", hr);
        }
        return converted.boolVal != VARIANT_FALSE;
    }

    int Variant::toInt() const
    {
        VARIANT converted;
        VariantInit(&converted);
        HRESULT const hr = VariantChangeType(&converted, &m_value, 0, VT_I4);
        if (FAILED(hr))
        {
            throwAutomationFailure("VariantChangeType(VT_I4)", hr);
        }
        return static_cast<int>(converted.lVal);
    }

    std::string Variant::toString() const
    {
        if (m_value.vt == VT_BSTR)
        {
            return toUtf8(m_value.bstrVal, static_cast<int>(SysStringLen(m_value.bstrVal)));
        }

        Variant converted;
        HRESULT const hr = VariantChangeType(&converted.m_value, &m_value, 0, VT_BSTR);
        if (FAILED(hr))
        {
            throwAutomationFailure("VariantChangeType(VT_BSTR)", hr);
        }
        return converted.toString();
    }

    DispatchObject Variant::toObject() const
    {
        if (m_value.vt != VT_DISPATCH || m_value.pdispVal == nullptr)
        {
            throw AutomationError("Automation call did not return an object");
        }
        m_value.pdispVal->AddRef();
        return DispatchObject(m_value.pdispVal);
    }

    DispatchObject::DispatchObject(IDispatch * dispatch)
        : m_dispatch(dispatch)
    {
    }

    DispatchObject::~DispatchObject()
    {
        if (m_dispatch != nullptr)
        {
            m_dispatch->Release();
        }
    }

    DispatchObject::DispatchObject(DispatchObject const & other)
        : m_dispatch(other.m_dispatch)
    {
        if (m_dispatch != nullptr)
        {
            m_dispatch->AddRef();
        }
    }

    DispatchObject & DispatchObject::operator=(DispatchObject const & other)
    {
        if (this != &other)
        {
            DispatchObject copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    DispatchObject::DispatchObject(DispatchObject && other) noexcept
        : m_dispatch(other.m_dispatch)
    {
        other.m_dispatch = nullptr;
    }

    DispatchObject & DispatchObject::operator=(DispatchObject && other) noexcept
    {
        if (this != &other)
        {
            if (m_dispatch != nullptr)
            {
                m_dispatch->Release();
            }
            m_dispatch = other.m_dispatch;
            other.m_dispatch = nullptr;
        }
        return *this;
    }

    DispatchObject DispatchObject::create(std::string const & progId)
    {
        CLSID clsid;
        std::wstring const wideProgId = toWide(progId);
        HRESULT hr = CLSIDFromProgID(wideProgId.c_str(), &clsid);
        if (FAILED(hr))
        {
            throw AutomationError(
              fmt::format("'{}' is not registered, is the word processor installed?", progId));
        }

        IDispatch * dispatch = nullptr;
        hr = CoCreateInstance(clsid,
                              nullptr,
                              CLSCTX_LOCAL_SERVER | CLSCTX_INPROC_SERVER,
                              IID_IDispatch,
                              reinterpret_cast<void **>(&dispatch));
        if (FAILED(hr))
        {
            throwAutomationFailure(fmt::format("CoCreateInstance({})", progId), hr);
        }
        return DispatchObject(dispatch);
    }

    Variant DispatchObject::call(std::string const & name, std::vector<Variant> args) const
    {
        return invoke(name, DISPATCH_METHOD | DISPATCH_PROPERTYGET, std::move(args));
    }

    Variant DispatchObject::property(std::string const & name) const
    {
        return invoke(name, DISPATCH_PROPERTYGET, {});
    }

    DispatchObject DispatchObject::object(std::string const & name) const
    {
        return property(name).toObject();
    }

    void DispatchObject::setProperty(std::string const & name, Variant value) const
    {
        std::vector<Variant> args;
        args.push_back(std::move(value));
        invoke(name, DISPATCH_PROPERTYPUT, std::move(args));
    }

    Variant
    DispatchObject::invoke(std::string const & name, WORD flags, std::vector<Variant> args) const
    {
        if (m_dispatch == nullptr)
        {
            throw AutomationError(fmt::format("Automation call '{}' on a released object", name));
        }

        std::wstring wideName = toWide(name);
        LPOLESTR names[] = {wideName.data()};
        DISPID dispId = 0;
        HRESULT hr =
          m_dispatch->GetIDsOfNames(IID_NULL, names, 1, LOCALE_USER_DEFAULT, &dispId);
        if (FAILED(hr))
        {
            throwAutomationFailure(name, hr);
        }

        // IDispatch expects the arguments in reverse order
        std::vector<VARIANT> rawArgs;
        rawArgs.reserve(args.size());
        for (auto it = args.rbegin(); it != args.rend(); ++it)
        {
            rawArgs.push_back(it->get());
        }

        DISPID putId = DISPID_PROPERTYPUT;
        DISPPARAMS params{};
        params.cArgs = static_cast<UINT>(rawArgs.size());
        params.rgvarg = rawArgs.empty() ? nullptr : rawArgs.data();
        if (flags & DISPATCH_PROPERTYPUT)
        {
            params.cNamedArgs = 1;
            params.rgdispidNamedArgs = &putId;
        }

        Variant result;
        EXCEPINFO exception{};
        hr = m_dispatch->Invoke(dispId,
                                IID_NULL,
                                LOCALE_SYSTEM_DEFAULT,
                                flags,
                                &params,
                                (flags & DISPATCH_PROPERTYPUT) ? nullptr : &result.get(),
                                &exception,
                                nullptr);
        if (hr == DISP_E_EXCEPTION)
        {
            std::string description = exception.bstrDescription != nullptr
                                        ? toUtf8(exception.bstrDescription,
                                                 static_cast<int>(SysStringLen(exception.bstrDescription)))
                                        : std::string{};
            SysFreeString(exception.bstrSource);
            SysFreeString(exception.bstrDescription);
            SysFreeString(exception.bstrHelpFile);

            long const code = exception.scode != 0 ? exception.scode : hr;
            if (isBlockedByUI(code))
            {
                throw BlockedByUIError(name, code);
            }
            throw AutomationError(fmt::format("Automation call '{}' raised: {}", name, description));
        }
        if (FAILED(hr))
        {
            throwAutomationFailure(name, hr);
        }
        return result;
    }
}

#endif
