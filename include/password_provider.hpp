/**
 * @file password_provider.hpp
 * @brief Sources of the encryption password.
 *
 * The password is never logged or persisted. Engines ask for it only when a stage needs it
 * and call clear() after a failed decryption so the next attempt asks again.
 */

#ifndef PASSWORD_PROVIDER_HPP
#define PASSWORD_PROVIDER_HPP

#include <mutex>
#include <optional>
#include <string>

/**
 * @brief Interface for password sources.
 */
class PasswordProvider {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~PasswordProvider() = default;

    /**
     * @brief Returns the password, or std::nullopt when none is available.
     */
    virtual std::optional<std::string> password() = 0;

    /**
     * @brief Forgets any cached secret.
     */
    virtual void clear() = 0;
};

/**
 * @brief Fixed password supplied by the caller.
 */
class StaticPasswordProvider : public PasswordProvider {
public:
    explicit StaticPasswordProvider(std::optional<std::string> password);

    std::optional<std::string> password() override;
    void clear() override;

private:
    std::mutex mutex_;
    std::optional<std::string> password_;
};

/**
 * @brief Reads the password from an environment variable (RESTORE_PASSWORD by default).
 */
class EnvironmentPasswordProvider : public PasswordProvider {
public:
    explicit EnvironmentPasswordProvider(std::string variable = "RESTORE_PASSWORD");

    std::optional<std::string> password() override;

    /**
     * @brief No-op; the environment is re-read on every call.
     */
    void clear() override {}

private:
    std::string variable_;
};

/**
 * @brief Prompts on the controlling terminal with echo disabled and caches the answer.
 */
class TerminalPasswordProvider : public PasswordProvider {
public:
    explicit TerminalPasswordProvider(std::string prompt = "Encryption password: ");

    std::optional<std::string> password() override;
    void clear() override;

private:
    std::mutex mutex_;
    std::string prompt_;
    std::optional<std::string> cached_;
};

#endif // PASSWORD_PROVIDER_HPP
