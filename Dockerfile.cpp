# Dockerfile for the hash-based signature cost models (C++20)
# Uses CMake and OpenSSL for building

FROM ubuntu:24.04

# Prevent interactive prompts
ENV DEBIAN_FRONTEND=noninteractive

# Install build dependencies
RUN apt-get update && apt-get install -y \
    build-essential \
    cmake \
    libssl-dev \
    && rm -rf /var/lib/apt/lists/*

WORKDIR /app

# Copy source code
COPY CMakeLists.txt ./
COPY src/cpp/ ./src/cpp/
COPY tests/cpp/ ./tests/cpp/
COPY examples/cpp/ ./examples/cpp/

# Build and run the test suites
RUN cmake -S . -B build -DCMAKE_BUILD_TYPE=Release && \
    cmake --build build -j$(nproc) && \
    cd build && ctest --output-on-failure

# Default command prints the cost report
CMD ["./build/hbscost_report"]
