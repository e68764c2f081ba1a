#include "oaicompat/client.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <variant>

namespace {

struct Turn
{
  std::string text;
  bool finished = false;
  bool saw_error = false;
};

std::string read_model(int argc, char** argv)
{
  if (argc > 1)
  {
    return argv[1];
  }
  return oaicompat::kDefaultModel;
}

}  // namespace

int main(int argc, char** argv)
{
  if (!oaicompat::ChatClient::is_configured())
  {
    std::cerr << "OPENAI_COMPATIBLE_API_KEY environment variable must be set\n";
    return 1;
  }

  try
  {
    // The main thread plays the UI thread: it owns the executor and drains it.
    auto ui = std::make_shared<oaicompat::TaskQueueExecutor>();

    oaicompat::ClientOptions options;
    options.model = read_model(argc, argv);

    oaicompat::ChatClient client(options, nullptr, ui);

    std::cout << "Interactive streaming chat against " << client.endpoint_url() << " (" << client.model() << ")\n"
              << "Type 'exit' or 'quit' to stop.\n";

    oaicompat::Conversation conversation;
    conversation.push_back(
        {oaicompat::Role::System, "You are a helpful assistant speaking to a user from a C++ demo app.", {}});

    for (;;)
    {
      std::cout << "\nYou> " << std::flush;
      std::string user_input;

      if (!std::getline(std::cin, user_input))
      {
        std::cout << "\nEnd of input, exiting.\n";
        break;
      }

      if (user_input == "exit" || user_input == "quit")
      {
        std::cout << "Goodbye!\n";
        break;
      }

      if (user_input.empty())
      {
        continue;
      }

      conversation.push_back({oaicompat::Role::User, user_input, {}});

      std::cout << "Assistant> " << std::flush;

      // Shared with the callback: a turn abandoned below may still receive late events.
      auto turn = std::make_shared<Turn>();

      client.query_async(
          conversation,
          [turn](const oaicompat::QueryEvent& event, const oaicompat::StatusTag&)
          {
            if (const auto* delta = std::get_if<oaicompat::DeltaEvent>(&event))
            {
              turn->text += delta->content;
              std::cout << delta->content << std::flush;
            }
            else if (const auto* error = std::get_if<oaicompat::ErrorEvent>(&event))
            {
              std::cerr << "\n[stream error] " << error->message << std::endl;
              turn->saw_error = true;
              turn->finished = true;
            }
            else if (std::holds_alternative<oaicompat::StopEvent>(event))
            {
              turn->finished = true;
            }
          },
          true);

      // Streams that end without [DONE] produce no terminal event; give up after a quiet minute.
      auto last_activity = std::chrono::steady_clock::now();
      while (!turn->finished)
      {
        if (ui->run_pending(std::chrono::milliseconds(50)) > 0)
        {
          last_activity = std::chrono::steady_clock::now();
        }
        else if (std::chrono::steady_clock::now() - last_activity > std::chrono::minutes(1))
        {
          break;
        }
      }

      std::cout << std::endl;

      if (turn->saw_error)
      {
        conversation.pop_back();
        std::cout << "Encountered an error. Please try again." << std::endl;
        continue;
      }

      conversation.push_back({oaicompat::Role::Assistant, turn->text.empty() ? "[No text returned]" : turn->text, {}});

      const auto usage = client.usage();
      std::cout << "[tokens: " << usage.prompt_tokens << " in, " << usage.completion_tokens << " out]" << std::endl;
    }
  }
  catch (const oaicompat::OaiCompatError& error)
  {
    std::cerr << "oaicompat error: " << error.what() << std::endl;
    return 1;
  }
  catch (const std::exception& error)
  {
    std::cerr << "Unexpected error: " << error.what() << std::endl;
    return 1;
  }

  return 0;
}
