/**
 * @file dockerfile_templates.cpp
 * @brief Dockerfile template table
 *
 * @date 2025
 */

#include "repoprobe/core/dockerfile_templates.hpp"

#include <array>

namespace repoprobe {
namespace core {

namespace {

// requirements.txt is optional, so it is installed after the full copy
const char* const kPythonTemplate = R"(FROM python:3.11-slim
RUN useradd -m appuser
WORKDIR /app
RUN apt-get update && apt-get install -y --no-install-recommends gcc python3-dev \
    && rm -rf /var/lib/apt/lists/*
COPY . .
RUN if [ -f requirements.txt ]; then \
        pip install --no-cache-dir -r requirements.txt || echo "Pip install warning"; \
    fi
USER appuser
ENV PYTHONUNBUFFERED=1
ENV PORT=8000
EXPOSE 8000 5000 8501
CMD {start_command}
)";

const char* const kNodeTemplate = R"(FROM node:20-slim
WORKDIR /app
COPY package*.json ./
RUN npm install --only=production || echo "NPM install failed"
COPY . .
USER node
ENV PORT=3000
EXPOSE 3000 8080
CMD {start_command}
)";

const char* const kGenericTemplate = R"(FROM ubuntu:22.04
RUN apt-get update && apt-get install -y bash curl
WORKDIR /app
COPY . .
ENV PORT=8080
EXPOSE 8080
CMD {start_command}
)";

const std::array<DockerfileTemplate, 3>& TemplateTable() {
    static const std::array<DockerfileTemplate, 3> table = {{
        {Language::PYTHON, "python:3.11-slim", {8000, 5000, 8501}, kPythonTemplate},
        {Language::NODE, "node:20-slim", {3000, 8080}, kNodeTemplate},
        {Language::GENERIC, "ubuntu:22.04", {8080}, kGenericTemplate},
    }};
    return table;
}

} // anonymous namespace

const DockerfileTemplate& GetDockerfileTemplate(Language language) {
    const auto& table = TemplateTable();
    for (const auto& entry : table) {
        if (entry.language == language) {
            return entry;
        }
    }
    return table.back();
}

} // namespace core
} // namespace repoprobe
