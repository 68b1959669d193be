#pragma once

namespace userjs {

class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);

    // Returns false if close(2) reported an error (e.g. deferred write failure).
    bool Close();

  private:
    int fd_{-1};
};

} // namespace userjs
